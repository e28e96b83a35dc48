#pragma once



#include <signal.h>
#include "utils/throw_line.hh"



namespace mdlink
{

// scoped interrupt guard: while an instance exists, the signal is recorded instead of
// terminating the process so the owner can stop at a safe point and run its cleanup
// an inherited SIG_IGN stays in effect, the guard then never reports an interrupt
template<int S>
class Signal
{
public:
    Signal()
        : _previous(setHandler())
    {
        engage();
    }


    ~Signal()
    {
        disengage();
        signal(S, _previous);
    }


    void engage()
    {
        _flag = 2;
    }


    void disengage()
    {
        _flag = 0;
    }


    bool interrupt() const
    {
        return _flag == 1;
    }


    static void raiseDefault()
    {
        resetHandler();
        ::raise(S);
        setHandler();
    }


    Signal(Signal const &) = delete;
    void operator=(Signal const &) = delete;

private:
    static volatile sig_atomic_t _flag;

    void (*_previous)(int);

    static void (*setHandler())(int)
    {
        auto old_handler = signal(S, handler);
        if(old_handler == SIG_ERR)
            throw_line("unable to set signal handler (signal: {})", S);

        if(old_handler == SIG_IGN)
            signal(S, SIG_IGN);
        else if(old_handler != SIG_DFL)
        {
            signal(S, old_handler);
            throw_line("signal handler already set (signal: {})", S);
        }

        return old_handler;
    }


    static void resetHandler()
    {
        signal(S, SIG_DFL);
    }


    static void handler(int)
    {
        if(!_flag)
            raiseDefault();
        else if(_flag == 2)
            _flag = 1;
    }
};

template<int S>
volatile sig_atomic_t Signal<S>::_flag;

using SignalINT = Signal<SIGINT>;

}
