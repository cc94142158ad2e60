#include <catch2/catch_test_macros.hpp>

#include "platform/linux/subprocess.hpp"
#include "platform/linux/whisper_runner.hpp"
#include "platform/linux/wtype_injector.hpp"
#include "test_support.hpp"
#include "wav_file.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <thread>
#include <vector>

using platform::ProcessOptions;
using platform::run_process;

TEST_CASE("Subprocess", "[platform]") {

    SECTION("ExitCode") {
        auto ok = run_process({"true"});
        REQUIRE(ok);
        REQUIRE(ok->exit_code == 0);

        auto fail = run_process({"false"});
        REQUIRE(fail);
        REQUIRE(fail->exit_code == 1);
    }

    SECTION("MissingProgram") {
        auto res = run_process({"voxpaste-no-such-program"});
        REQUIRE(res);
        REQUIRE(res->exit_code == 127);
    }

    SECTION("CapturesOutput") {
        auto res = run_process({"echo", "hello"}, {.capture_output = true});
        REQUIRE(res);
        REQUIRE(res->output == "hello\n");
    }

    SECTION("OutputDiscardedByDefault") {
        auto res = run_process({"echo", "hello"});
        REQUIRE(res);
        REQUIRE(res->output.empty());
    }

    SECTION("FeedsStdin") {
        std::string big(200000, 'x');
        auto res = run_process({"cat"}, {.input = big, .capture_output = true});
        REQUIRE(res);
        REQUIRE(res->output == big);
    }

    SECTION("StopKillsChild") {
        std::stop_source src;
        std::jthread canceller([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            src.request_stop();
        });

        auto start = std::chrono::steady_clock::now();
        auto res = run_process({"sleep", "10"}, {}, src.get_token());
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(res);
        REQUIRE(res->stopped);
        REQUIRE(res->exit_code != 0);
        REQUIRE(elapsed < std::chrono::seconds(5));
    }

    SECTION("WhileOtherThreadsAllocate") {
        std::atomic<bool> done{false};
        std::vector<std::jthread> churn;
        for (int t = 0; t < 4; ++t) {
            churn.emplace_back([&] {
                while (!done) {
                    std::vector<std::string> junk(64, std::string(256, 'x'));
                }
            });
        }

        for (int i = 0; i < 50; ++i) {
            auto res = run_process({"echo", std::to_string(i)}, {.capture_output = true});
            REQUIRE(res);
            REQUIRE(res->output == std::to_string(i) + "\n");
        }
        done = true;
    }

    SECTION("FindInPath") {
        REQUIRE(platform::find_in_path("sh"));
        REQUIRE_FALSE(platform::find_in_path("voxpaste-no-such-program"));
    }
}

TEST_CASE("Wtype command line", "[platform]") {
    auto strokes = paste_sequence("ctrl+shift+v");
    auto argv = WtypeInjector::command_for(strokes);
    REQUIRE(argv == std::vector<std::string>{"wtype", "-M", "ctrl", "-M", "shift", "-P", "v",
                                             "-p", "v", "-m", "shift", "-m", "ctrl"});
}

TEST_CASE("Whisper runner", "[platform][local]") {
    test::TmpDir dir("runner");
    WhisperRunner runner(false, false);

    SECTION("LoadMissingModel") {
        auto res = runner.load(dir.path / "ggml-missing.bin");
        REQUIRE_FALSE(res);
        REQUIRE(res.error() == "ggml-missing.bin not found");
        REQUIRE(runner.loaded_model().empty());
    }

    SECTION("LoadRejectsNonModel") {
        auto bad = dir.path / "ggml-fake.bin";
        std::ofstream(bad, std::ios::binary) << "GGUF" << std::string(64, '\0');
        auto res = runner.load(bad);
        REQUIRE_FALSE(res);
        REQUIRE(res.error() == "couldn't load ggml-fake.bin");
        REQUIRE(runner.loaded_model().empty());
    }

    SECTION("RunWithoutModel") {
        auto wav_path = dir.path / "a.wav";
        REQUIRE(wav::write_file(wav_path, std::vector<int16_t>(1600, 0), 16000));
        auto res = runner.run(wav_path, {}, {});
        REQUIRE_FALSE(res);
        REQUIRE_FALSE(res.error().cancelled);
        REQUIRE(res.error().message == "no model loaded");
    }
}
