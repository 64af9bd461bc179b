#ifndef CTXDB_CORE_RECORD_H_
#define CTXDB_CORE_RECORD_H_

#include <map>
#include <memory>
#include <string>

#include "ctxdb/core/types.h"

namespace ctxdb {
namespace schema {
class TypeDescriptor;
}

namespace core {

/**
 * @brief A document conforming to one TypeDescriptor
 *
 * The identifier is kept apart from the field map; the "id" key of the wire
 * format maps onto it. A record may be bound to the descriptor it was decoded
 * with, in which case the index checks descriptor compatibility before
 * checking the fields themselves.
 */
class Record {
public:
    using Map = std::map<std::string, FieldValue>;

    Record() = default;
    explicit Record(RecordID id);
    explicit Record(std::shared_ptr<const schema::TypeDescriptor> descriptor);

    const RecordID& id() const { return id_; }
    bool has_id() const { return !id_.empty(); }
    void set_id(RecordID id) { id_ = std::move(id); }

    // Assigns a generated identifier when none is set
    const RecordID& ensure_id();

    void set(const std::string& name, FieldValue value);
    void set_null(const std::string& name) { set(name, FieldValue{}); }
    void remove(const std::string& name);

    // nullptr when the field is absent
    const FieldValue* get(const std::string& name) const;

    // nullptr when the field is absent, null, or not a vector
    const Vector* get_vector(const std::string& name) const;

    bool has(const std::string& name) const;
    const Map& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }

    const std::shared_ptr<const schema::TypeDescriptor>& descriptor() const { return descriptor_; }
    void bind(std::shared_ptr<const schema::TypeDescriptor> descriptor) { descriptor_ = std::move(descriptor); }

    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

    std::string to_string() const;

    static RecordID GenerateId();

private:
    RecordID id_;
    std::shared_ptr<const schema::TypeDescriptor> descriptor_;
    Map fields_;
};

} // namespace core
} // namespace ctxdb

#endif // CTXDB_CORE_RECORD_H_
