#pragma once

#include <lifecycle-core/fwd.hh>
#include <lifecycle-core/utility.hh>

#include <functional>
#include <type_traits>

/// Move-only owning callable wrapper with signature T
/// Similar to std::function but move-only, allowing capture of unique resources
/// (setup callables capturing a std::unique_ptr, teardown callables owning a handle, ...)
/// Is actually even stronger: allows non-moveable "pinned" captures via create_from
/// Like unique_ptr<int>, const-ness of this object does not imply constness of the pointed-to object!
/// This is what allows a const lc::managed to run mutable setup lambdas on every build.
template <class R, class... Args>
struct lc::unique_function<R(Args...)>
{
public:
    R operator()(Args... args) const
    {
        LC_ASSERT(is_valid(), "cannot call in invalid lc::unique_function");
        return _thunk(_payload, lc::forward<Args>(args)...);
    }

    bool is_valid() const { return _payload != nullptr; }
    explicit operator bool() const { return _payload != nullptr; }

public:
    unique_function() = default;

    // note: this ctor requires moveability
    //       use the factory method for in-place construction
    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, unique_function>)
    unique_function(F&& f)
    {
        using Fn = std::remove_cvref_t<F>;

        static_assert(std::is_invocable_r_v<R, Fn&, Args...>, "F must be callable with Args... and return R");
        static_assert(std::is_constructible_v<Fn, F>, "cannot copy/move into the unique_function. try direct "
                                                      "construction via create_from.");

        this->impl_emplace<Fn>(lc::forward<F>(f));
    }

    // directly emplaces F in target storage
    template <class F, class... FArgs>
    [[nodiscard]] static unique_function create_from(FArgs&&... args)
    {
        static_assert(std::is_invocable_r_v<R, F&, Args...>, "F must be callable with Args... and return R");

        unique_function uf;
        uf.template impl_emplace<F>(lc::forward<FArgs>(args)...);
        return uf;
    }

    unique_function(unique_function&& rhs) noexcept
      : _payload(lc::exchange(rhs._payload, nullptr)),
        _thunk(lc::exchange(rhs._thunk, nullptr)),
        _destroy(lc::exchange(rhs._destroy, nullptr))
    {
    }
    unique_function& operator=(unique_function&& rhs) noexcept
    {
        if (this != &rhs)
        {
            this->impl_reset();
            _payload = lc::exchange(rhs._payload, nullptr);
            _thunk = lc::exchange(rhs._thunk, nullptr);
            _destroy = lc::exchange(rhs._destroy, nullptr);
        }
        return *this;
    }
    unique_function(unique_function const&) = delete;
    unique_function& operator=(unique_function const&) = delete;

    ~unique_function() { this->impl_reset(); }

private:
    template <class F, class... FArgs>
    void impl_emplace(FArgs&&... args)
    {
        // NOLINTBEGIN
        _payload = new F(lc::forward<FArgs>(args)...);
        _thunk = [](void* p, Args... args) -> R { return std::invoke_r<R>(*static_cast<F*>(p), lc::forward<Args>(args)...); };
        _destroy = [](void* p) { delete static_cast<F*>(p); };
        // NOLINTEND
    }

    void impl_reset()
    {
        if (_payload != nullptr)
            _destroy(_payload);
        _payload = nullptr;
        _thunk = nullptr;
        _destroy = nullptr;
    }

    // member
private:
    // future: we could do SBO here for small captures
    void* _payload = nullptr;
    lc::function_ptr<R(void*, Args...)> _thunk = nullptr;
    lc::function_ptr<void(void*)> _destroy = nullptr;
};
