// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.
//
// Replays fuzzer inputs without libFuzzer, e.g. to debug a crash or to run the corpus as a
// regression test. Based off of StandaloneFuzzTargetMain.c in libFuzzer.

#include "fuzzer.h"
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

static auto run_input(const std::filesystem::path &path) -> void
{
    fmt::print(stderr, "Running: {}\n", path.string());

    std::ifstream ifs(path, std::ios::binary);
    CHECK_TRUE(ifs.is_open());
    const std::string buffer((std::istreambuf_iterator<char>(ifs)),
                             std::istreambuf_iterator<char>());

    LLVMFuzzerTestOneInput(reinterpret_cast<const uint8_t *>(buffer.data()), buffer.size());
    fmt::print(stderr, "Done:    {}: ({} bytes)\n", path.string(), buffer.size());
}

auto main(int argc, const char *argv[]) -> int
{
    namespace fs = std::filesystem;
    fmt::print(stderr, "main: running {} inputs\n", argc - 1);

    for (int i = 1; i < argc; ++i) {
        if (fs::is_directory(argv[i])) {
            for (const auto &entry : fs::directory_iterator(argv[i])) {
                run_input(entry.path());
            }
        } else {
            run_input(argv[i]);
        }
    }
    return 0;
}
