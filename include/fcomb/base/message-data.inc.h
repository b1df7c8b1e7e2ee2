DECLARE_MESSAGE(ABoolean, (), "", "a boolean")
DECLARE_MESSAGE(ACargoMetadataDocument, (), "", "a cargo metadata document")
DECLARE_MESSAGE(ADependency, (), "", "a dependency")
DECLARE_MESSAGE(AFeatureCombinationsConfiguration, (), "", "a feature combinations configuration object")
DECLARE_MESSAGE(AFeatureMap, (), "", "a map of feature names to implied features")
DECLARE_MESSAGE(AFeatureName, (), "", "a feature name")
DECLARE_MESSAGE(AMatrixObject, (), "", "a matrix object")
DECLARE_MESSAGE(AMetadataObject, (), "", "a metadata object")
DECLARE_MESSAGE(APackage, (), "", "a package")
DECLARE_MESSAGE(APackageId, (), "", "a package id")
DECLARE_MESSAGE(APackageName, (), "", "a package name")
DECLARE_MESSAGE(APath, (), "", "a path")
DECLARE_MESSAGE(AString, (), "", "a string")
DECLARE_MESSAGE(AWorkspaceConfiguration, (), "", "a workspace configuration object")
DECLARE_MESSAGE(AnArrayOfDependencies, (), "", "an array of dependencies")
DECLARE_MESSAGE(AnArrayOfFeatureNames, (), "", "an array of feature names")
DECLARE_MESSAGE(AnArrayOfFeatureSets, (), "", "an array of feature sets")
DECLARE_MESSAGE(AnArrayOfPackageIds, (), "", "an array of package ids")
DECLARE_MESSAGE(AnArrayOfPackageNames, (), "", "an array of package names")
DECLARE_MESSAGE(AnArrayOfPackages, (), "", "an array of packages")
DECLARE_MESSAGE(CargoCommandLine, (msg::command_line), "", "[cargo {command_line}]")
DECLARE_MESSAGE(CargoMetadataFailed,
                (msg::command_line, msg::exit_code),
                "",
                "command:\n"
                "{command_line}\n"
                "failed with exit code {exit_code}")
DECLARE_MESSAGE(CargoMetadataKilled, (msg::command_line), "", "command:\n{command_line}\nwas terminated by a signal")
DECLARE_MESSAGE(CargoMetadataParseFailed, (msg::command_line), "", "failed to parse the output of {command_line}:")
DECLARE_MESSAGE(ChecksFailedCheck, (), "", "cargo-fc has crashed; no additional details are available.")
DECLARE_MESSAGE(ChecksUnreachableCode, (), "", "unreachable code was reached")
DECLARE_MESSAGE(ControlCharacterInString, (), "", "Control character in string")
DECLARE_MESSAGE(DeprecatedConfigField,
                (msg::package_name, msg::old_value, msg::new_value),
                "{old_value} and {new_value} are configuration field names and should not be translated",
                "{package_name}: the configuration field \"{old_value}\" is deprecated; its entries were merged into "
                "\"{new_value}\"")
DECLARE_MESSAGE(DuplicatedKeyInObj,
                (msg::value),
                "{value} is a json property/object",
                "Duplicated key \"{value}\" in an object")
DECLARE_MESSAGE(ExcludePackagesOnNonRootPackage,
                (msg::package_name),
                "exclude_packages is a configuration field name and should not be translated",
                "{package_name}: \"exclude_packages\" only has an effect in the workspace metadata or in the root "
                "package; it is ignored here")
DECLARE_MESSAGE(ExpectedDigitsAfterDecimal, (), "", "Expected digits after the decimal point")
DECLARE_MESSAGE(FailedToParseConfiguration,
                (msg::package_name),
                "",
                "failed to parse the feature combinations configuration of {package_name}:")
DECLARE_MESSAGE(FailedToParseWorkspaceConfiguration,
                (),
                "",
                "failed to parse the feature combinations configuration of the workspace:")
DECLARE_MESSAGE(FailedToReadCargoOutput,
                (msg::package_name),
                "",
                "failed to read the diagnostic output of cargo for {package_name}; warning and error counts are "
                "unavailable")
DECLARE_MESSAGE(FailedToSpawnCargo, (msg::command_line), "", "failed to launch {command_line}")
DECLARE_MESSAGE(FeatureCombinationCount, (msg::count), "", "{count} total feature combinations")
DECLARE_MESSAGE(FeatureCombinationCountOne, (msg::count), "", "{count} total feature combination")
DECLARE_MESSAGE(FloatingPointConstTooBig, (msg::count), "", "Floating point constant too big: {count}")
DECLARE_MESSAGE(FormattedParseMessageExpressionPrefix, (), "", "on expression:")
DECLARE_MESSAGE(HelpConfiguration,
                (),
                "The TOML example is code and should not be translated",
                "Feature sets can be configured in your Cargo.toml configuration.\n"
                "For example:\n"
                "\n"
                "```toml\n"
                "[package.metadata.cargo-feature-combinations]\n"
                "# Exclude groupings of features that are incompatible or do not make sense\n"
                "exclude_feature_sets = [ [\"foo\", \"bar\"], ]\n"
                "\n"
                "# Exclude features from the feature combination matrix\n"
                "exclude_features = [\"default\", \"full\"]\n"
                "\n"
                "# Include features in every combination\n"
                "include_features = [\"feature-that-must-always-be-set\"]\n"
                "\n"
                "# Only consider combinations within these groups of features\n"
                "isolated_feature_sets = [ [\"hydrate\", \"ssr\"], [\"csr\"], ]\n"
                "\n"
                "# Build exactly these feature sets and nothing else\n"
                "allow_feature_sets = [ [\"hydrate\"], [\"ssr\"], ]\n"
                "\n"
                "# Do not build the empty feature set\n"
                "no_empty_feature_set = true\n"
                "\n"
                "# Skip features implied by optional dependencies\n"
                "skip_optional_dependencies = true\n"
                "\n"
                "# Skip workspace packages entirely (workspace or root package only)\n"
                "exclude_packages = [\"package-a\"]\n"
                "```\n"
                "\n"
                "See 'cargo help <command>' for more information on a specific command.")
DECLARE_MESSAGE(HelpDescription, (), "", "Run cargo commands for all feature combinations")
DECLARE_MESSAGE(HelpErrorsOnly, (), "", "Allow all warnings, show errors only (-Awarnings)")
DECLARE_MESSAGE(HelpExcludePackage, (), "", "Exclude a package from the run (may be repeated)")
DECLARE_MESSAGE(HelpFailFast, (), "", "Fail fast on the first bad feature combination")
DECLARE_MESSAGE(HelpHelp, (), "", "Print help information")
DECLARE_MESSAGE(HelpManifestPath, (), "", "Path to the Cargo.toml of the workspace or package")
DECLARE_MESSAGE(HelpMatrix, (), "", "Print JSON feature combination matrix to stdout")
DECLARE_MESSAGE(HelpOptionsHeader, (), "", "OPTIONS:")
DECLARE_MESSAGE(HelpPackage, (), "", "Only run on the named package (may be repeated)")
DECLARE_MESSAGE(HelpPackagesOnly, (), "", "Print one matrix entry per package")
DECLARE_MESSAGE(HelpPedantic, (), "", "Treat warnings like errors in summary and when using --fail-fast")
DECLARE_MESSAGE(HelpPretty, (), "", "Print pretty JSON")
DECLARE_MESSAGE(HelpSilent, (), "", "Hide cargo output and only show summary")
DECLARE_MESSAGE(HelpSubcommandHeader, (), "", "SUBCOMMAND:")
DECLARE_MESSAGE(HelpUsage,
                (),
                "The command lines are code and should not be translated",
                "USAGE:\n"
                "    cargo fc [SUBCOMMAND] [SUBCOMMAND_OPTIONS]\n"
                "    cargo fc [OPTIONS] [CARGO_OPTIONS] [CARGO_SUBCOMMAND] [-- EXTRA_ARGS]")
DECLARE_MESSAGE(InvalidFloatingPointConst, (msg::count), "", "Invalid floating point constant: {count}")
DECLARE_MESSAGE(InvalidHexDigit, (), "", "Invalid hex digit in unicode escape")
DECLARE_MESSAGE(InvalidIntegerConst, (msg::count), "", "Invalid integer constant: {count}")
DECLARE_MESSAGE(JsonErrorMustBeAnObject, (msg::path), "", "Expected \"{path}\" to be an object.")
DECLARE_MESSAGE(JsonValueNotArray, (), "", "json value is not an array")
DECLARE_MESSAGE(JsonValueNotObject, (), "", "json value is not an object")
DECLARE_MESSAGE(JsonValueNotString, (), "", "json value is not a string")
DECLARE_MESSAGE(ManifestDoesNotExist, (msg::path), "", "manifest {path} does not exist")
DECLARE_MESSAGE(MismatchedType,
                (msg::json_field, msg::json_type),
                "",
                "{json_field}: mismatched type: expected {json_type}")
DECLARE_MESSAGE(MissingRequiredField,
                (msg::json_field, msg::json_type),
                "Example completely formatted message:\nerror: missing required field 'name' (a package name)",
                "missing required field '{json_field}' ({json_type})")
DECLARE_MESSAGE(NoParentDirectory, (msg::path), "", "could not find parent dir of package {path}")
DECLARE_MESSAGE(OptionRequiresValue, (msg::option), "", "the option {option} requires a value")
DECLARE_MESSAGE(PackageCount, (msg::count), "", "{count} packages")
DECLARE_MESSAGE(PackageCountOne, (msg::count), "", "{count} package")
DECLARE_MESSAGE(PackageFeatures,
                (msg::package_name, msg::features),
                "{features} is a comma separated list of feature names",
                "{package_name} ( features = [{features}] )")
DECLARE_MESSAGE(StatusBuilding, (), "Printed before the package being built, in the style of cargo", "Building")
DECLARE_MESSAGE(StatusChecking, (), "Printed before the package being checked, in the style of cargo", "Checking")
DECLARE_MESSAGE(StatusFail, (), "", "FAIL")
DECLARE_MESSAGE(StatusFinished, (), "", "Finished")
DECLARE_MESSAGE(StatusPass, (), "", "PASS")
DECLARE_MESSAGE(StatusRunning, (), "Printed before the package being run, in the style of cargo", "Running")
DECLARE_MESSAGE(StatusTesting, (), "Printed before the package being tested, in the style of cargo", "Testing")
DECLARE_MESSAGE(StatusWarn, (), "", "WARN")
DECLARE_MESSAGE(SummaryOutcome,
                (msg::package_name, msg::errors, msg::warnings, msg::features),
                "{errors} and {warnings} are right aligned counts or '?'; {features} is a comma separated list",
                "{package_name} ( {errors} errors, {warnings} warnings, features = [{features}] )")
DECLARE_MESSAGE(SummaryTotals,
                (msg::combinations, msg::packages, msg::elapsed),
                "Example completely formatted message:\n4 total feature combinations for 1 package in 3.532s",
                "{combinations} for {packages} in {elapsed}")
DECLARE_MESSAGE(SystemApiErrorMessage,
                (msg::system_api, msg::exit_code, msg::error_msg),
                "",
                "calling {system_api} failed with {exit_code} ({error_msg})")
DECLARE_MESSAGE(TooManyConfigurations,
                (msg::package_name, msg::count, msg::limit),
                "",
                "{package_name}: too many configurations: {count} feature combinations exceed the limit of {limit}")
DECLARE_MESSAGE(TrailingCommaInArray, (), "", "Trailing comma in array")
DECLARE_MESSAGE(TrailingCommaInObj, (), "", "Trailing comma in an object")
DECLARE_MESSAGE(UnexpectedCharExpectedCloseBrace, (), "", "Unexpected character; expected property or close brace")
DECLARE_MESSAGE(UnexpectedCharExpectedColon, (), "", "Unexpected character; expected colon")
DECLARE_MESSAGE(UnexpectedCharExpectedName, (), "", "Unexpected character; expected property name")
DECLARE_MESSAGE(UnexpectedCharExpectedValue, (), "", "Unexpected character; expected value")
DECLARE_MESSAGE(UnexpectedCharMidArray, (), "", "Unexpected character in middle of array")
DECLARE_MESSAGE(UnexpectedCharMidKeyword, (), "", "Unexpected character in middle of keyword")
DECLARE_MESSAGE(UnexpectedDigitsAfterLeadingZero, (), "", "Unexpected digits after a leading zero")
DECLARE_MESSAGE(UnexpectedEOFAfterEscape, (), "", "Unexpected EOF after escape character")
DECLARE_MESSAGE(UnexpectedEOFAfterMinus, (), "", "Unexpected EOF after minus sign")
DECLARE_MESSAGE(UnexpectedEOFExpectedChar, (), "", "Unexpected character; expected EOF")
DECLARE_MESSAGE(UnexpectedEOFExpectedCloseBrace, (), "", "Unexpected EOF; expected property or close brace")
DECLARE_MESSAGE(UnexpectedEOFExpectedColon, (), "", "Unexpected EOF; expected colon")
DECLARE_MESSAGE(UnexpectedEOFExpectedName, (), "", "Unexpected EOF; expected property name")
DECLARE_MESSAGE(UnexpectedEOFExpectedValue, (), "", "Unexpected EOF; expected value")
DECLARE_MESSAGE(UnexpectedEOFMidArray, (), "", "Unexpected EOF in middle of array")
DECLARE_MESSAGE(UnexpectedEOFMidKeyword, (), "", "Unexpected EOF in middle of keyword")
DECLARE_MESSAGE(UnexpectedEOFMidString, (), "", "Unexpected EOF in middle of string")
DECLARE_MESSAGE(UnexpectedEOFMidUnicodeEscape, (), "", "Unexpected end of file in middle of unicode escape")
DECLARE_MESSAGE(UnexpectedEscapeSequence, (), "", "Unexpected escape sequence continuation")
DECLARE_MESSAGE(UnexpectedField, (msg::json_field), "", "unexpected field '{json_field}'")
DECLARE_MESSAGE(UnexpectedFieldSuggest,
                (msg::json_field, msg::value),
                "{value} is a suggested field name to use in a JSON document",
                "unexpected field '{json_field}', did you mean '{value}'?")
