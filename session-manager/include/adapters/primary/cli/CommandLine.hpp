#pragma once

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandbox::adapters::primary {

/**
 * @brief Разобранные аргументы командной строки
 *
 * "--name value" для опций из valueOptions, "--name" для флагов,
 * всё остальное позиционные аргументы. Поддерживается "--name=value".
 */
class CommandLine {
public:
    /**
     * @throws std::invalid_argument если у опции нет значения
     */
    static CommandLine parse(const std::vector<std::string>& args, const std::set<std::string>& valueOptions) {
        CommandLine cl;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
                cl.positionals_.push_back(arg);
                continue;
            }

            std::string name = arg.substr(2);
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                cl.options_[name.substr(0, eq)] = name.substr(eq + 1);
                continue;
            }

            if (valueOptions.count(name) > 0) {
                if (i + 1 >= args.size()) {
                    throw std::invalid_argument("Option --" + name + " requires a value");
                }
                cl.options_[name] = args[++i];
            } else {
                cl.flags_.insert(name);
            }
        }
        return cl;
    }

    bool hasFlag(const std::string& name) const {
        return flags_.count(name) > 0;
    }

    std::optional<std::string> option(const std::string& name) const {
        auto it = options_.find(name);
        if (it == options_.end()) return std::nullopt;
        return it->second;
    }

    /**
     * @throws std::invalid_argument если значение не целое число
     */
    std::optional<int> intOption(const std::string& name) const {
        auto value = option(name);
        if (!value) return std::nullopt;
        return toInt(*value, "--" + name);
    }

    const std::vector<std::string>& positionals() const { return positionals_; }

    std::optional<std::string> positional(size_t index) const {
        if (index >= positionals_.size()) return std::nullopt;
        return positionals_[index];
    }

    static int toInt(const std::string& value, const std::string& what) {
        try {
            size_t consumed = 0;
            int result = std::stoi(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return result;
        } catch (const std::logic_error&) {
            throw std::invalid_argument(what + " must be an integer, got '" + value + "'");
        }
    }

private:
    std::vector<std::string> positionals_;
    std::map<std::string, std::string> options_;
    std::set<std::string> flags_;
};

} // namespace sandbox::adapters::primary
