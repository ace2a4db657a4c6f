// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for CallbackGate

#include <catch2/catch_test_macros.hpp>

#include "util/callback_gate.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace kadcast::util;
using namespace std::chrono_literals;

TEST_CASE("CallbackGate: admission", "[callback_gate]") {
    CallbackGate gate;

    SECTION("Open gate admits and counts callers") {
        CallbackGate::Pass outer(gate);
        REQUIRE(outer);
        {
            CallbackGate::Pass inner(gate);
            REQUIRE(inner);
            REQUIRE(gate.active() == 2);
        }
        REQUIRE(gate.active() == 1);
    }

    SECTION("Closed gate refuses callers") {
        gate.close();
        gate.close();
        REQUIRE(gate.is_closed());
        CallbackGate::Pass pass(gate);
        REQUIRE_FALSE(pass);
        REQUIRE(gate.active() == 0);
    }
}

TEST_CASE("CallbackGate: close waits for admitted callers", "[callback_gate]") {
    CallbackGate gate;
    std::atomic<bool> inside{false};
    std::atomic<bool> finished{false};

    std::thread caller([&]() {
        CallbackGate::Pass pass(gate);
        inside = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
    });

    while (!inside) {
        std::this_thread::yield();
    }
    gate.close();
    REQUIRE(finished);
    REQUIRE(gate.active() == 0);
    caller.join();
}
