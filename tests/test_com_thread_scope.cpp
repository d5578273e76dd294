#include <catch2/catch_test_macros.hpp>

#include "admute/mute/win/ComThreadScope.hpp"

#include <thread>
#include <vector>

namespace
{

// Runs `fn` on a fresh thread; assertions stay on the test thread
template <typename Fn>
std::vector<HRESULT> onFreshThread(Fn fn)
{
    std::vector<HRESULT> results;
    std::thread worker([&] { fn(results); });
    worker.join();
    return results;
}

} // namespace

TEST_CASE("ComThreadScope - Enters COM once per thread", "[actuator][com]")
{
    auto results = onFreshThread(
        [](std::vector<HRESULT>& out)
        {
            admute::ComThreadScope scope;
            out.push_back(scope.enter());
            out.push_back(scope.enter());
        });

    REQUIRE(results == std::vector<HRESULT>{ S_OK, S_FALSE });
}

TEST_CASE("ComThreadScope - Leaves COM on destruction", "[actuator][com]")
{
    auto results = onFreshThread(
        [](std::vector<HRESULT>& out)
        {
            {
                admute::ComThreadScope scope;
                out.push_back(scope.enter());
            }
            // S_OK only when the apartment was fully released
            const HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
            out.push_back(hr);
            if (SUCCEEDED(hr))
                CoUninitialize();
        });

    REQUIRE(results == std::vector<HRESULT>{ S_OK, S_OK });
}

TEST_CASE("ComThreadScope - Does not balance a foreign apartment", "[actuator][com]")
{
    auto results = onFreshThread(
        [](std::vector<HRESULT>& out)
        {
            const HRESULT sta = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
            out.push_back(sta);
            {
                admute::ComThreadScope scope;
                out.push_back(scope.enter());
            }
            // The single-threaded apartment is still held by this thread
            const HRESULT again = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
            out.push_back(again);
            if (SUCCEEDED(again))
                CoUninitialize();
            if (SUCCEEDED(sta))
                CoUninitialize();
        });

    REQUIRE(results == std::vector<HRESULT>{ S_OK, RPC_E_CHANGED_MODE, S_FALSE });
}
