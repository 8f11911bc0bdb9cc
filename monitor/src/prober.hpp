#pragma once

#include "types.hpp"
#include <string>
#include <memory>
#include <chrono>

// Performs a single health request. Implementations never throw:
// every failure is reported inside the returned CheckOutcome.
class Prober {
public:
    virtual ~Prober() = default;

    virtual CheckOutcome probe(const std::string& name,
                               const std::string& url,
                               std::chrono::milliseconds timeout) = 0;
};

// GET over HTTP(S) via cpr, one attempt, no retries
class HttpProber : public Prober {
public:
    explicit HttpProber(const std::string& user_agent = "svcmon/0.1.0");
    ~HttpProber() override;

    CheckOutcome probe(const std::string& name,
                       const std::string& url,
                       std::chrono::milliseconds timeout) override;

    // Non-copyable
    HttpProber(const HttpProber&) = delete;
    HttpProber& operator=(const HttpProber&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
