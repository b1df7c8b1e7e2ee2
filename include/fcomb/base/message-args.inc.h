DECLARE_MSG_ARG(combinations, "8 total feature combinations")
DECLARE_MSG_ARG(command_line, "cargo metadata --format-version 1 --no-deps")
DECLARE_MSG_ARG(count, "42")
DECLARE_MSG_ARG(elapsed, "3.532s")
DECLARE_MSG_ARG(error_msg, "File Not Found")
DECLARE_MSG_ARG(errors, "2")
DECLARE_MSG_ARG(exit_code, "127")
DECLARE_MSG_ARG(features, "hydrate, ssr")
DECLARE_MSG_ARG(json_field, "exclude_feature_sets")
DECLARE_MSG_ARG(json_type, "an array of feature names")
DECLARE_MSG_ARG(limit, "100000")
DECLARE_MSG_ARG(new_value, "exclude_feature_sets")
DECLARE_MSG_ARG(old_value, "skip_feature_sets")
DECLARE_MSG_ARG(option, "manifest-path")
DECLARE_MSG_ARG(package_name, "leptos")
DECLARE_MSG_ARG(packages, "3 packages")
DECLARE_MSG_ARG(path, "/foo/bar/Cargo.toml")
DECLARE_MSG_ARG(system_api, "posix_spawn")
DECLARE_MSG_ARG(value, "")
DECLARE_MSG_ARG(warnings, "13")
