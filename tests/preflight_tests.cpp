/*
 * Preflight check tests
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "log.hpp"
#include "preflight.hpp"
#include "util.hpp"

#include "test_support.hpp"

static const config::platform_config *cli(void) { return config::platform_for(config::Entry::Cli); }

static int test_runtime_missing_is_fatal(void) {
    scratch_dir root;
    scratch_dir bin;
    struct runtime_probe probe = {};

    EXPECT(write_project(root.path), "write project");

    std::string search = bin.path;
    config::bootstrap_env env = {search.c_str(), nullptr, root.path.c_str()};
    RESULT result = preflight_check(&env, cli(), &probe);

    EXPECT(FAILED(result), "missing runtime fails");
    EXPECT(RESULT_CATEGORY(result) == CAT_PREFLIGHT && RESULT_CODE(result) == E_RUNTIME_MISSING,
           "missing runtime is E_RUNTIME_MISSING");
    EXPECT(!probe.found && !probe.path, "probe reports nothing found");
    return 0;
}

static int test_non_executable_runtime_counts_as_missing(void) {
    scratch_dir root;
    scratch_dir bin;
    scratch_dir record;
    struct runtime_probe probe = {};

    EXPECT(write_project(root.path), "write project");
    EXPECT(write_fake_runtime(bin.path, record.path, {}), "write runtime");
    EXPECT(chmod((bin / "python3").c_str(), 0644) == 0, "drop exec bits");

    config::bootstrap_env env = {bin.path.c_str(), "/venv", root.path.c_str()};
    RESULT result = preflight_check(&env, cli(), &probe);

    EXPECT(FAILED(result) && RESULT_CODE(result) == E_RUNTIME_MISSING, "non-executable runtime is missing");
    return 0;
}

static int test_runtime_checked_before_directory(void) {
    scratch_dir not_root;
    scratch_dir bin;
    struct runtime_probe probe = {};

    config::bootstrap_env env = {bin.path.c_str(), nullptr, not_root.path.c_str()};
    RESULT result = preflight_check(&env, cli(), &probe);

    EXPECT(FAILED(result) && RESULT_CODE(result) == E_RUNTIME_MISSING, "runtime failure is reported first");
    return 0;
}

static int test_wrong_directory_is_fatal(void) {
    scratch_dir not_root;
    scratch_dir bin;
    scratch_dir record;
    struct runtime_probe probe = {};

    EXPECT(write_fake_runtime(bin.path, record.path, {}), "write runtime");
    /* The marker has to be a file under src/, a directory of the same name doesn't count */
    EXPECT(ensure_dir((not_root / "src/main.py").c_str()) == RESULT_OK, "make decoy directory");

    config::bootstrap_env env = {bin.path.c_str(), "/venv", not_root.path.c_str()};
    RESULT result = preflight_check(&env, cli(), &probe);

    EXPECT(FAILED(result), "missing marker fails");
    EXPECT(RESULT_CATEGORY(result) == CAT_PREFLIGHT && RESULT_CODE(result) == E_WRONG_DIRECTORY,
           "missing marker is E_WRONG_DIRECTORY");
    EXPECT(probe.found, "the runtime itself was found");

    runtime_probe_free(&probe);
    return 0;
}

static int test_relative_path_element_gives_absolute_runtime(void) {
    scratch_dir root;
    scratch_dir record;
    struct runtime_probe probe = {};

    EXPECT(write_project(root.path), "write project");
    EXPECT(write_fake_runtime(root / "venv/bin", record.path, {}), "write runtime inside the project");

    config::bootstrap_env env = {"venv/bin", "/venv", root.path.c_str()};
    EXPECT(preflight_check(&env, cli(), &probe) == RESULT_OK, "runtime found through a relative element");
    EXPECT(probe.path && probe.path[0] == '/', "runtime path is absolute");
    EXPECT(root / "venv/bin/python3" == probe.path, "runtime path is anchored at the project root");

    runtime_probe_free(&probe);
    return 0;
}

static int test_missing_isolation_is_advisory(void) {
    scratch_dir root;
    scratch_dir bin;
    scratch_dir record;
    struct runtime_probe probe = {};

    EXPECT(write_project(root.path), "write project");
    EXPECT(write_fake_runtime(bin.path, record.path, {}), "write runtime");

    /* Empty PATH elements and missing directories are skipped over */
    std::string search = ":/nonexistent-dir:" + bin.path;
    config::bootstrap_env env = {search.c_str(), nullptr, root.path.c_str()};
    EXPECT(!is_isolated(&env), "no hint means not isolated");

    std::string captured = record / "stdout";
    log_set_console_output(true);
    stdout_capture capture(captured);
    RESULT result = preflight_check(&env, cli(), &probe);
    capture.finish();
    log_set_console_output(false);

    EXPECT(result == RESULT_OK, "advisory doesn't fail the check");
    std::string out = read_text(captured);
    EXPECT(out.find("No virtual environment is active") != std::string::npos, "advisory is printed on stdout");
    EXPECT(out.find("source venv/bin/activate") != std::string::npos, "POSIX activation command is shown");
    EXPECT(out.find("venv\\Scripts\\activate") != std::string::npos, "Windows activation command is shown");
    EXPECT(probe.found && bin / "python3" == probe.path, "runtime path is recorded");
    EXPECT(probe.version && STRING_EQUALS(probe.version, "Python 3.11.4"), "runtime version is recorded");

    config::bootstrap_env empty_hint = {search.c_str(), "", root.path.c_str()};
    EXPECT(!is_isolated(&empty_hint), "empty hint means not isolated");

    config::bootstrap_env isolated = {search.c_str(), "/home/user/venv", root.path.c_str()};
    EXPECT(is_isolated(&isolated), "hint set means isolated");
    EXPECT(preflight_check(&isolated, cli(), &probe) == RESULT_OK, "isolated environment passes");

    runtime_probe_free(&probe);
    EXPECT(!probe.path && !probe.version, "probe is cleared");
    return 0;
}

int main(void) {
    int failures = 0;

    RUN_TEST(test_runtime_missing_is_fatal);
    RUN_TEST(test_non_executable_runtime_counts_as_missing);
    RUN_TEST(test_runtime_checked_before_directory);
    RUN_TEST(test_wrong_directory_is_fatal);
    RUN_TEST(test_relative_path_element_gives_absolute_runtime);
    RUN_TEST(test_missing_isolation_is_advisory);

    return failures ? 1 : 0;
}
