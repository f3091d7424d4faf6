#include "rule/rule_loader.hpp"

#include "rule/rule_module.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <dlfcn.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {
std::string getDynamicLoaderError() {
    const char* message = dlerror();
    return message ? std::string{ message } : std::string{ "unknown error" };
}
} // namespace

LoadedRule makeLoadedRule(std::unique_ptr<IRuleModule> module) {
    return LoadedRule{ .library = nullptr, .module = std::move(module), .path = {} };
}

Result<LoadedRule> DynamicRuleLoader::loadRule(const std::filesystem::path& path) {
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        return Error{ ErrorCode::RuleLoading, "Could not open " + path.string() + ": " + getDynamicLoaderError() };
    }
    std::shared_ptr<void> library(handle, [](void* libraryHandle) { dlclose(libraryHandle); });

    void* symbol = dlsym(handle, CreateRuleModuleSymbol);
    if (symbol == nullptr) {
        return Error{ ErrorCode::RuleLoading, path.string() + " does not export " + CreateRuleModuleSymbol };
    }

    CreateRuleModuleFunction createRuleModule = reinterpret_cast<CreateRuleModuleFunction>(symbol);
    std::unique_ptr<IRuleModule> module{ createRuleModule() };
    if (module == nullptr) {
        return Error{ ErrorCode::RuleLoading, path.string() + " did not create a rule module" };
    }

    return LoadedRule{ .library = std::move(library), .module = std::move(module), .path = path };
}

bool isRuleModuleFile(const std::filesystem::path& path) {
    return path.extension() == ".so";
}

Result<std::vector<LoadedRule>> loadRulesFromDirectory(const std::filesystem::path& directory, IRuleLoader& loader) {
    std::error_code errorCode;
    if (!std::filesystem::is_directory(directory, errorCode)) {
        return Error{ ErrorCode::InvalidRulesDirectory, "Provided path is not a directory: " + directory.string() };
    }

    std::vector<std::filesystem::path> candidates;
    for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator(directory, errorCode)) {
        if (entry.is_regular_file() && isRuleModuleFile(entry.path())) {
            candidates.push_back(entry.path());
        }
    }
    if (errorCode) {
        return Error{ ErrorCode::InvalidRulesDirectory, "Could not read " + directory.string() + ": " + errorCode.message() };
    }

    // Directory iteration order is unspecified
    std::sort(candidates.begin(), candidates.end());

    std::vector<LoadedRule> rules;
    std::vector<std::string> failures;
    for (const std::filesystem::path& candidate : candidates) {
        Result<LoadedRule> loadResult = loader.loadRule(candidate);
        if (loadResult.isError()) {
            failures.push_back(loadResult.getError().message);
            continue;
        }

        LoadedRule& rule = loadResult.getValue();
        std::string version = rule.module->getVersion();
        if (version != MaoVersion) {
            failures.push_back(candidate.string() + " was built for version " + version + ", expected " + std::string{ MaoVersion });
            continue;
        }

        rules.push_back(std::move(rule));
    }

    if (!failures.empty()) {
        return Error{ ErrorCode::RuleLoading, "Could not load " + std::to_string(failures.size()) + " rule(s):\n" + join(failures, "\n") };
    }

    return rules;
}
