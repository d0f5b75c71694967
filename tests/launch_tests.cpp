/*
 * Entry point handoff tests
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <csignal>

#include "launch.hpp"
#include "util.hpp"

#include "test_support.hpp"

using config::Entry;

static int test_cli_entry_gets_arguments_verbatim(void) {
    scratch_dir root;
    scratch_dir bin;
    scratch_dir record;
    int exit_code = -1;

    EXPECT(write_project(root.path), "write project");
    EXPECT(write_fake_runtime(bin.path, record.path, {}), "write runtime");

    const char *args[] = {"--verbose", "foo", "two words", ""};
    RESULT result = launch_entry(config::platform_for(Entry::Cli), root.path.c_str(), (bin / "python3").c_str(), args,
                                 4, &exit_code);
    EXPECT(result == RESULT_OK, "launch succeeds");
    EXPECT(exit_code == 0, "exit code of the entry point");

    std::vector<std::string> expected = {"cli_main.py", "--verbose", "foo", "two words", ""};
    EXPECT(read_lines(record / "entry_args") == expected, "arguments arrive unmodified and in order");
    EXPECT(read_lines(record / "entry_cwd") == std::vector<std::string>{root.path}, "cli entry runs in the root");
    return 0;
}

static int test_gui_entry_runs_from_its_directory(void) {
    scratch_dir root;
    scratch_dir bin;
    scratch_dir record;
    int exit_code = -1;

    EXPECT(write_project(root.path), "write project");
    EXPECT(write_fake_runtime(bin.path, record.path, {}), "write runtime");

    RESULT result = launch_entry(config::platform_for(Entry::Gui), root.path.c_str(), (bin / "python3").c_str(),
                                 nullptr, 0, &exit_code);
    EXPECT(result == RESULT_OK, "launch succeeds");
    EXPECT(read_lines(record / "entry_args") == std::vector<std::string>{"main.py"}, "no extra arguments");
    EXPECT(read_lines(record / "entry_cwd") == std::vector<std::string>{root / "src"}, "gui entry runs in src");
    return 0;
}

static int test_exit_code_is_propagated(void) {
    scratch_dir root;
    scratch_dir bin;
    scratch_dir record;
    fake_runtime_behavior behavior;
    behavior.entry_status = 42;
    int exit_code = -1;

    EXPECT(write_project(root.path), "write project");
    EXPECT(write_fake_runtime(bin.path, record.path, behavior), "write runtime");

    RESULT result = launch_entry(config::platform_for(Entry::Cli), root.path.c_str(), (bin / "python3").c_str(),
                                 nullptr, 0, &exit_code);
    EXPECT(result == RESULT_OK, "a failing entry point still launched fine");
    EXPECT(exit_code == 42, "exit code is the entry point's");
    return 0;
}

static int test_killed_entry_maps_to_shell_status(void) {
    scratch_dir root;
    scratch_dir bin;
    scratch_dir record;
    fake_runtime_behavior behavior;
    behavior.entry_kills_itself = true;
    int exit_code = -1;

    EXPECT(write_project(root.path), "write project");
    EXPECT(write_fake_runtime(bin.path, record.path, behavior), "write runtime");

    RESULT result = launch_entry(config::platform_for(Entry::Cli), root.path.c_str(), (bin / "python3").c_str(),
                                 nullptr, 0, &exit_code);
    EXPECT(result == RESULT_OK, "launch succeeds");
    EXPECT(exit_code == 128 + SIGTERM, "SIGTERM becomes 143");
    return 0;
}

static int test_interrupt_handling_is_restored(void) {
    scratch_dir root;
    scratch_dir bin;
    scratch_dir record;
    struct sigaction before = {}, after = {};
    int exit_code = -1;

    EXPECT(write_project(root.path), "write project");
    EXPECT(write_fake_runtime(bin.path, record.path, {}), "write runtime");

    sigaction(SIGINT, nullptr, &before);
    RESULT result = launch_entry(config::platform_for(Entry::Cli), root.path.c_str(), (bin / "python3").c_str(),
                                 nullptr, 0, &exit_code);
    sigaction(SIGINT, nullptr, &after);

    EXPECT(result == RESULT_OK, "launch succeeds");
    EXPECT(before.sa_handler == after.sa_handler, "SIGINT disposition is back to what it was");
    return 0;
}

static int test_unstartable_runtime_fails(void) {
    scratch_dir root;
    int exit_code = -1;

    EXPECT(write_project(root.path), "write project");

    RESULT result = launch_entry(config::platform_for(Entry::Cli), root.path.c_str(), (root / "missing").c_str(),
                                 nullptr, 0, &exit_code);
    EXPECT(FAILED(result), "launch fails");
    EXPECT(RESULT_CATEGORY(result) == CAT_LAUNCH && RESULT_CODE(result) == E_SPAWN_FAILED, "spawn failure");
    return 0;
}

int main(void) {
    int failures = 0;

    RUN_TEST(test_cli_entry_gets_arguments_verbatim);
    RUN_TEST(test_gui_entry_runs_from_its_directory);
    RUN_TEST(test_exit_code_is_propagated);
    RUN_TEST(test_killed_entry_maps_to_shell_status);
    RUN_TEST(test_interrupt_handling_is_restored);
    RUN_TEST(test_unstartable_runtime_fails);

    return failures ? 1 : 0;
}
