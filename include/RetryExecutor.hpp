#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "Logger.hpp"

template <typename T>
struct RetryOutcome
{
    bool Success = false;
    unsigned int Attempts = 0;
    std::string LastError;
    std::optional<T> Value;
};

template <>
struct RetryOutcome<void>
{
    bool Success = false;
    unsigned int Attempts = 0;
    std::string LastError;
};

class RetryExecutor
{
public:
    // Runs Operation up to MaxAttempts times (0 counts as 1) and stops at the first success.
    // Any std::exception is a retryable failure; the last reason is kept in the outcome.
    // Never throws a failure of Operation back to the caller.
    template <typename Callable>
    static auto Execute(const std::string& ActionName, Callable&& Operation, unsigned int MaxAttempts,
                        std::chrono::milliseconds Delay = std::chrono::milliseconds(0))
        -> RetryOutcome<std::invoke_result_t<Callable&>>
    {
        using ResultType = std::invoke_result_t<Callable&>;

        RetryOutcome<ResultType> Outcome;
        const unsigned int Limit = (MaxAttempts == 0) ? 1 : MaxAttempts;

        for (unsigned int Attempt = 1; Attempt <= Limit; ++Attempt)
        {
            Outcome.Attempts = Attempt;
            try
            {
                if constexpr (std::is_void_v<ResultType>)
                {
                    Operation();
                }
                else
                {
                    Outcome.Value.emplace(Operation());
                }
                Outcome.Success = true;
                return Outcome;
            }
            catch (const std::exception& e)
            {
                Outcome.LastError = e.what();
            }

            Log.Warning(std::string("[Retry] ") + ActionName + " failed (attempt " + std::to_string(Attempt) + "/" + std::to_string(Limit) + "): " + Outcome.LastError);

            if (Attempt < Limit && Delay.count() > 0)
            {
                std::this_thread::sleep_for(Delay);
            }
        }

        Log.Error(std::string("[Retry] ") + ActionName + " failed after " + std::to_string(Limit) + " attempts. Last error: " + Outcome.LastError);
        return Outcome;
    }
};
