#include <dcore/periodic.hpp>
#include <dcore/ut.hpp>
#include <atomic>
#include <thread>

using dcore::periodic;
using namespace std::chrono;

int main(int, char **){
    // A lambda called every 10ms.
    std::atomic<int> nfast{0};
    {
        periodic p([&](){ nfast++; return milliseconds(10); });
        std::this_thread::sleep_for(milliseconds(300));
    }
    // Destroyed.  It should never be called again.
    int after_dtor = nfast.load();
    CHECK(after_dtor >= 5);
    std::this_thread::sleep_for(milliseconds(50));
    EQUAL(nfast.load(), after_dtor);

    // A long interval.  It runs once right away, and then only when
    // triggered.
    int nslow = 0;
    periodic q([&](){ nslow++; return hours(1); });
    std::this_thread::sleep_for(milliseconds(100));
    {
        std::lock_guard<std::mutex> lg(q.mutex());
        EQUAL(nslow, 1);
    }
    q.trigger();
    std::this_thread::sleep_for(milliseconds(100));
    {
        std::lock_guard<std::mutex> lg(q.mutex());
        EQUAL(nslow, 2);
    }

    // duration<float> works too.
    std::atomic<int> nfloat{0};
    {
        periodic pf([&](){ nfloat++; return duration<float>(0.01f); });
        std::this_thread::sleep_for(milliseconds(100));
    }
    CHECK(nfloat.load() >= 2);

    // The destructor of a periodic with a long sleep returns promptly.
    auto t0 = steady_clock::now();
    {
        periodic plong([](){ return hours(24); });
        std::this_thread::sleep_for(milliseconds(10));
    }
    CHECK(steady_clock::now() - t0 < seconds(5));

    return utstatus();
}
