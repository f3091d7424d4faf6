#include "cli/cli_dispatcher.hpp"
#include "cli/mao_commands.hpp"
#include "rule/rule_loader.hpp"

#include <iostream>
#include <memory>

int main() {
    CliDispatcher dispatcher("Mao", Version{ .major = 1, .minor = 0, .patch = 0 });
    MaoContext context{ .loader = std::make_unique<DynamicRuleLoader>() };
    registerAllCommands(dispatcher, context);

    dispatcher.run(std::cin);

    return 0;
}
