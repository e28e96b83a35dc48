// based on N4189: http://www.open-std.org/jtc1/sc22/wg21/docs/papers/2014/n4189
// reduced to what device teardown needs: a resource released exactly once

#pragma once



#include <type_traits>
#include <utility>



namespace mdlink
{

template<typename R, typename D>
class unique_resource
{
public:
    explicit unique_resource(R &&resource, D &&deleter, bool should_run = true) noexcept
        : _resource(std::move(resource))
        , _deleter(std::move(deleter))
        , _shouldRun(should_run)
    {
    }

    unique_resource(unique_resource &&other) noexcept
        : _resource(std::move(other._resource))
        , _deleter(std::move(other._deleter))
        , _shouldRun(other._shouldRun)
    {
        other.release();
    }

    ~unique_resource()
    {
        reset();
    }

    // runs the deleter now if it hasn't run yet, subsequent calls do nothing
    void reset()
    {
        if(_shouldRun)
        {
            _shouldRun = false;
            _deleter(_resource);
        }
    }

    R const &release() noexcept
    {
        _shouldRun = false;
        return _resource;
    }

    R const &get() const noexcept
    {
        return _resource;
    }

    bool armed() const noexcept
    {
        return _shouldRun;
    }

    unique_resource &operator=(unique_resource &&) = delete;
    unique_resource &operator=(unique_resource const &) = delete;
    unique_resource(unique_resource const &) = delete;

private:
    R _resource;
    D _deleter;
    bool _shouldRun;
};


template<typename R, typename D>
auto make_unique_resource(R &&r, D &&d) noexcept
{
    return unique_resource<std::remove_reference_t<R>, std::remove_reference_t<D>>(std::move(r), std::forward<std::remove_reference_t<D>>(d), true);
}

}
