#ifndef EYEMAP_RESULT_HPP
#define EYEMAP_RESULT_HPP

#include <string>
#include <utility>
#include <variant>

namespace eyemap {

enum class ErrorKind {
    Validation,      // Malformed or missing request fields
    DataProcessing,  // Inconsistent or insufficient column/lattice data
    Rendering,       // Template, raster or output failure
    Performance      // Cache or instrumentation failure (never fatal)
};

const char* error_kind_name(ErrorKind kind);

/**
 * Typed error carried through Result<T>.
 * field/value identify the offending input for validation errors.
 */
struct Error {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
    std::string operation;
    std::string field;
    std::string value;

    std::string to_string() const;
};

inline Error make_error(ErrorKind kind, std::string message, std::string operation = {}) {
    Error e;
    e.kind = kind;
    e.message = std::move(message);
    e.operation = std::move(operation);
    return e;
}

inline Error make_validation_error(std::string message, std::string field, std::string value,
                                   std::string operation = {}) {
    Error e = make_error(ErrorKind::Validation, std::move(message), std::move(operation));
    e.field = std::move(field);
    e.value = std::move(value);
    return e;
}

/**
 * Either a value or an Error. Components return this instead of throwing;
 * the caller decides whether to abort or continue.
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    const Error& error() const { return std::get<1>(data_); }

    T value_or(T fallback) const { return ok() ? std::get<0>(data_) : std::move(fallback); }

private:
    std::variant<T, Error> data_;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)), ok_(false) {}

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    const Error& error() const { return error_; }

private:
    Error error_;
    bool ok_ = true;
};

using Status = Result<void>;

inline Status ok_status() { return Status(); }

} // namespace eyemap

#endif // EYEMAP_RESULT_HPP
