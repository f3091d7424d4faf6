#include "cli/cli_dispatcher.hpp"

#include "util/string_utils.hpp"

#include <cctype>
#include <cstddef>
#include <iostream>
#include <istream>
#include <map>
#include <string>
#include <vector>

CliDispatcher::CliDispatcher(const std::string& programName, const Version& version) : m_programName{ programName }, m_version{ version }, m_isRunning{ false } {
    registerCommand("help", "Prints this help page.", [this]() { return handleHelp(); });
    registerCommand("exit", "Exits the program.", [this]() { return handleExit(); });
}

bool CliDispatcher::isCommandNameValid(const std::string& name) const {
    if (name.empty()) {
        return false;
    }

    for (char c : name) {
        if (!std::isgraph(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    return m_commandDescriptions.find(name) == m_commandDescriptions.end();
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_handlersWithoutArguments.insert({ name, handler });
    return true;
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_commandArguments.insert({ name, argument });
    m_handlersWithArguments.insert({ name, handler });
    return true;
}

void CliDispatcher::run(std::istream& input) {
    m_isRunning = true;

    std::cout << m_programName << " " << m_version.major << "." << m_version.minor << "." << m_version.patch << "\n";
    std::cout << "Type \"help\" for more information.\n";
    while (m_isRunning) {
        std::cout << "> ";
        std::string line;
        if (!std::getline(input, line)) {
            std::cout << "\n";
            m_isRunning = false;
            break;
        }
        execute(line);
    }
}

bool CliDispatcher::execute(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return false;
    }

    std::size_t separator = trimmed.find_first_of(" \t");
    std::string commandName = trimmed.substr(0, separator);
    std::string argument = (separator == std::string::npos) ? "" : trim(trimmed.substr(separator));

    if (m_handlersWithoutArguments.find(commandName) != m_handlersWithoutArguments.end()) {
        if (!argument.empty()) {
            std::cerr << "Error: " << commandName << " takes no argument, got \"" << argument << "\"\n";
            return false;
        }

        return m_handlersWithoutArguments[commandName]();
    }
    else if (m_handlersWithArguments.find(commandName) != m_handlersWithArguments.end()) {
        if (argument.empty()) {
            std::cerr << "Error: Missing argument <" << m_commandArguments[commandName] << "> for " << commandName << "\n";
            return false;
        }

        return m_handlersWithArguments[commandName](argument);
    }
    else {
        std::cerr << "Error: Unknown command: " << commandName << "\n";
        return false;
    }
}

bool CliDispatcher::isRunning() const {
    return m_isRunning;
}

bool CliDispatcher::handleHelp() const {
    std::cout << m_programName << " options:\n";
    for (const std::string& name : m_commandOrder) {
        std::cout << name;

        if (m_commandArguments.find(name) != m_commandArguments.end()) {
            std::cout << " <" << m_commandArguments.at(name) << ">";
        }

        std::cout << ": " << m_commandDescriptions.at(name) << "\n";
    }
    return true;
}

bool CliDispatcher::handleExit() {
    m_isRunning = false;
    return true;
}
