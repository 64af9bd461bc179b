#include "ctxdb/core/record.h"
#include <mutex>
#include <random>
#include <sstream>

namespace ctxdb {
namespace core {

namespace {
const char kIdField[] = "id";
}

Record::Record(RecordID id) : id_(std::move(id)) {}

Record::Record(std::shared_ptr<const schema::TypeDescriptor> descriptor)
    : descriptor_(std::move(descriptor)) {}

const RecordID& Record::ensure_id() {
    if (id_.empty()) {
        id_ = GenerateId();
    }
    return id_;
}

void Record::set(const std::string& name, FieldValue value) {
    // The identifier is not a regular field
    if (name == kIdField) {
        if (auto* s = std::get_if<std::string>(&value)) {
            id_ = *s;
            return;
        }
        if (IsNull(value)) {
            id_.clear();
            return;
        }
    }
    fields_[name] = std::move(value);
}

void Record::remove(const std::string& name) {
    if (name == kIdField) {
        id_.clear();
    }
    fields_.erase(name);
}

const FieldValue* Record::get(const std::string& name) const {
    auto it = fields_.find(name);
    if (it == fields_.end()) {
        return nullptr;
    }
    return &it->second;
}

const Vector* Record::get_vector(const std::string& name) const {
    const FieldValue* value = get(name);
    if (!value) {
        return nullptr;
    }
    return std::get_if<Vector>(value);
}

bool Record::has(const std::string& name) const {
    return fields_.count(name) > 0;
}

bool Record::operator==(const Record& other) const {
    return id_ == other.id_ && fields_ == other.fields_;
}

std::string Record::to_string() const {
    std::ostringstream out;
    out << "Record{id=" << (id_.empty() ? "<unset>" : id_);
    for (const auto& [name, value] : fields_) {
        out << ", " << name << "=";
        if (IsNull(value)) {
            out << "null";
        } else if (auto* s = std::get_if<std::string>(&value)) {
            out << '"' << *s << '"';
        } else if (auto* i = std::get_if<int64_t>(&value)) {
            out << *i;
        } else if (auto* d = std::get_if<double>(&value)) {
            out << *d;
        } else if (auto* b = std::get_if<bool>(&value)) {
            out << (*b ? "true" : "false");
        } else if (auto* v = std::get_if<Vector>(&value)) {
            out << "vector[" << v->size() << "]";
        }
    }
    out << "}";
    return out.str();
}

RecordID Record::GenerateId() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = engine();
        lo = engine();
    }

    static const char kHex[] = "0123456789abcdef";
    std::string id(32, '0');
    for (int i = 0; i < 16; ++i) {
        id[15 - i] = kHex[(hi >> (i * 4)) & 0xF];
        id[31 - i] = kHex[(lo >> (i * 4)) & 0xF];
    }
    return id;
}

} // namespace core
} // namespace ctxdb
