#ifndef RULE_LOADER_HPP
#define RULE_LOADER_HPP

#include "rule/rule_module.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <memory>
#include <vector>

// The library is declared first so that it outlives the module
struct LoadedRule {
    std::shared_ptr<void> library;
    std::unique_ptr<IRuleModule> module;
    std::filesystem::path path;
};

LoadedRule makeLoadedRule(std::unique_ptr<IRuleModule> module);

class IRuleLoader {
public:
    virtual ~IRuleLoader() = default;

    virtual Result<LoadedRule> loadRule(const std::filesystem::path& path) = 0;
};

class DynamicRuleLoader : public IRuleLoader {
public:
    Result<LoadedRule> loadRule(const std::filesystem::path& path) override;
};

bool isRuleModuleFile(const std::filesystem::path& path);

// Scans the directory non-recursively and reports every rejected module at once
Result<std::vector<LoadedRule>> loadRulesFromDirectory(const std::filesystem::path& directory, IRuleLoader& loader);

#endif // RULE_LOADER_HPP
