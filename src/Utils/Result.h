#pragma once

#include <string>
#include <variant>
#include <utility>

namespace Atrium::Utils {

// Value-or-error return type for loaders. Per-frame code never returns one of
// these; it degrades to logged no-ops instead.
template<typename T, typename E = std::string>
class Result {
private:
    // Keeps Ok/Err distinct when T and E are the same type
    struct ErrorBox {
        E error;
        explicit ErrorBox(E e) : error(std::move(e)) {}
    };

public:
    static Result Ok(T value) {
        return Result(std::move(value), true);
    }

    static Result Err(E error) {
        return Result(ErrorBox(std::move(error)), false);
    }

    [[nodiscard]] bool IsOk() const { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool IsErr() const { return std::holds_alternative<ErrorBox>(m_data); }
    explicit operator bool() const { return IsOk(); }

    [[nodiscard]] T& Value() & { return std::get<T>(m_data); }
    [[nodiscard]] const T& Value() const& { return std::get<T>(m_data); }
    [[nodiscard]] T&& Value() && { return std::move(std::get<T>(m_data)); }

    [[nodiscard]] const E& Error() const& { return std::get<ErrorBox>(m_data).error; }

private:
    explicit Result(T value, bool) : m_data(std::move(value)) {}
    explicit Result(ErrorBox error, bool) : m_data(std::move(error)) {}

    std::variant<T, ErrorBox> m_data;
};

} // namespace Atrium::Utils
