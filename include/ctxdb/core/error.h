#ifndef CTXDB_CORE_ERROR_H_
#define CTXDB_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace ctxdb {
namespace core {

/**
 * @brief Base class for all ctxdb errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        FAILED_PRECONDITION = 4,
        INTERNAL = 5,
        INVALID_SCHEMA = 6,
        UNKNOWN_BASE_SHAPE = 7,
        SCHEMA_CONFLICT = 8,
        TYPE_MISMATCH = 9,
        DIMENSION_MISMATCH = 10,
        EMPTY_VECTOR_FIELD = 11,
        FIELD_NOT_FOUND = 12
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Stable identifier of an error code ("DIMENSION_MISMATCH", ...)
 */
const char* CodeName(Error::Code code);

#define CTXDB_DEFINE_ERROR(Name, CodeValue)                          \
    class Name : public Error {                                      \
    public:                                                          \
        explicit Name(const std::string& message)                    \
            : Error(message, Code::CodeValue) {}                     \
        explicit Name(const char* message)                           \
            : Error(message, Code::CodeValue) {}                     \
    }

/**
 * @brief Error indicating invalid arguments or parameters
 */
CTXDB_DEFINE_ERROR(InvalidArgumentError, INVALID_ARGUMENT);

/**
 * @brief Error indicating resource not found
 */
CTXDB_DEFINE_ERROR(NotFoundError, NOT_FOUND);

/**
 * @brief Error indicating resource already exists
 */
CTXDB_DEFINE_ERROR(AlreadyExistsError, ALREADY_EXISTS);

/**
 * @brief Error indicating the target is not in a state that allows the operation
 */
CTXDB_DEFINE_ERROR(FailedPreconditionError, FAILED_PRECONDITION);

/**
 * @brief Error indicating internal error
 */
CTXDB_DEFINE_ERROR(InternalError, INTERNAL);

// Materialization errors
CTXDB_DEFINE_ERROR(InvalidSchemaError, INVALID_SCHEMA);
CTXDB_DEFINE_ERROR(UnknownBaseShapeError, UNKNOWN_BASE_SHAPE);

// Registry errors
CTXDB_DEFINE_ERROR(SchemaConflictError, SCHEMA_CONFLICT);

// Index errors
CTXDB_DEFINE_ERROR(TypeMismatchError, TYPE_MISMATCH);
CTXDB_DEFINE_ERROR(DimensionMismatchError, DIMENSION_MISMATCH);
CTXDB_DEFINE_ERROR(EmptyVectorFieldError, EMPTY_VECTOR_FIELD);
CTXDB_DEFINE_ERROR(FieldNotFoundError, FIELD_NOT_FOUND);

#undef CTXDB_DEFINE_ERROR

} // namespace core
} // namespace ctxdb

#endif // CTXDB_CORE_ERROR_H_
