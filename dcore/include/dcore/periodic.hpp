#pragma once
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <future>
#include <functional>
#include "datetimeutils.hpp"

// periodic - Periodically call a function (or any other callable).

// periodic(F) : The constructor starts an asynchronous thread which
//     repeatedly calls F, which must return a std::chrono::duration.
//     Each time F returns, the thread sleeps for the returned
//     duration (which may vary from one invocation to the next).  If
//     F throws, the loop terminates and F is not called again.  So a
//     long-lived F should catch and complain about its own errors.

// trigger() : if F is currently running, wait for it to finish.
//     Then notify the thread to call F again immediately, regardless
//     of the duration returned by the last invocation.

// ~periodic() : if F is currently running, wait for it to finish.
//     Then notify the thread to exit its loop, and wait for it to
//     complete.

// mutex() : a mutex that is held by the thread whenever F is running
//     (and also by trigger()).  Locking it prevents F from running.
//     Deadlock will occur if trigger() is called with the mutex locked.

// Usage:
//
//     periodic p([](){ std::cerr << "Foo\n"; return std::chrono::minutes(1); });

namespace dcore{

class periodic{
public:
    template <typename FType>
    explicit periodic(FType F, std::enable_if_t<  is_duration<std::invoke_result_t<FType>>::value  >* = nullptr){
        fut = std::async(std::launch::async,
                         [this, F = std::move(F)]() mutable {
                             std::unique_lock<std::mutex> lk(mtx);
                             while(!done){
                                 auto how_long = F();
                                 if(done)
                                     break;
                                 triggered = false;
                                 cv.wait_until(lk, time_point_plus(std::chrono::steady_clock::now(), how_long),
                                               [this]{ return done || triggered; });
                             }
                         });
    }

    periodic(const periodic&) = delete;
    periodic& operator=(const periodic&) = delete;

    void trigger(){
        std::unique_lock<std::mutex> lk(mtx);
        triggered = true;
        cv.notify_all();
    }

    std::mutex& mutex(){ return mtx; }

    ~periodic(){
        std::unique_lock<std::mutex> lk(mtx);
        done = true;
        cv.notify_all();
        lk.unlock();
        // The async thread may still be using cv, done and mtx.  Wait
        // for it before our members are destroyed.
        fut.wait();
    }
private:
    std::condition_variable cv;
    bool done = false;
    bool triggered = false;
    std::mutex mtx;
    std::future<void> fut;
};

} // namespace dcore
