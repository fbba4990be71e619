#pragma once

// gatefile::expected resolves to std::expected where the standard library
// ships it. Older libraries get the reduced form below: value or error access,
// a boolean test, value_or and the void case. Nothing monadic.

#include <version>

#if defined(GATEFILE_HAS_STD_EXPECTED) || (defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L)

#include <expected>

namespace gatefile {
    using std::expected;
    using std::unexpected;
}

#else

#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace gatefile {

template<typename E>
class unexpected {
public:
    explicit unexpected(E e) : error_(std::move(e)) {}

    const E& error() const& noexcept { return error_; }
    E& error() & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

private:
    E error_;
};

template<typename E>
unexpected(E) -> unexpected<E>;

namespace detail {

// Slot 0 holds the value (std::monostate for void), slot 1 the error.
template<typename V, typename E>
class expected_storage {
public:
    bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const E& error() const& noexcept { return std::get<1>(state_); }
    E& error() & noexcept { return std::get<1>(state_); }
    E&& error() && noexcept { return std::get<1>(std::move(state_)); }

protected:
    template<typename... Args>
    explicit expected_storage(std::in_place_index_t<0> tag, Args&&... args)
        : state_(tag, std::forward<Args>(args)...) {}

    template<typename G>
    explicit expected_storage(unexpected<G>&& u)
        : state_(std::in_place_index<1>, std::move(u).error()) {}

    template<typename G>
    explicit expected_storage(const unexpected<G>& u)
        : state_(std::in_place_index<1>, u.error()) {}

    std::variant<V, E> state_;
};

} // namespace detail

template<typename T, typename E>
class expected : public detail::expected_storage<T, E> {
    using base = detail::expected_storage<T, E>;

public:
    using value_type = T;
    using error_type = E;

    expected() requires std::is_default_constructible_v<T>
        : base(std::in_place_index<0>) {}

    template<typename U = T>
        requires (!std::is_same_v<std::remove_cvref_t<U>, expected>) &&
                 (!std::is_same_v<std::remove_cvref_t<U>, unexpected<E>>) &&
                 std::is_constructible_v<T, U>
    expected(U&& v) : base(std::in_place_index<0>, std::forward<U>(v)) {}

    template<typename G>
    expected(unexpected<G>&& u) : base(std::move(u)) {}

    template<typename G>
    expected(const unexpected<G>& u) : base(u) {}

    T& operator*() & noexcept { return std::get<0>(this->state_); }
    const T& operator*() const& noexcept { return std::get<0>(this->state_); }
    T&& operator*() && noexcept { return std::get<0>(std::move(this->state_)); }

    T* operator->() noexcept { return std::addressof(**this); }
    const T* operator->() const noexcept { return std::addressof(**this); }

    template<typename U>
    T value_or(U&& fallback) const& {
        return this->has_value() ? **this : static_cast<T>(std::forward<U>(fallback));
    }
};

template<typename E>
class expected<void, E> : public detail::expected_storage<std::monostate, E> {
    using base = detail::expected_storage<std::monostate, E>;

public:
    using value_type = void;
    using error_type = E;

    expected() noexcept : base(std::in_place_index<0>) {}

    template<typename G>
    expected(unexpected<G>&& u) : base(std::move(u)) {}

    template<typename G>
    expected(const unexpected<G>& u) : base(u) {}

    void operator*() const noexcept {}
};

} // namespace gatefile

#endif // GATEFILE_HAS_STD_EXPECTED
