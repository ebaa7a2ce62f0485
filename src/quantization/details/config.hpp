#ifndef ROUNDWISE_QUANTIZATION_DETAILS_CONFIG_HPP
#define ROUNDWISE_QUANTIZATION_DETAILS_CONFIG_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../../common/save_load.hpp"
#include "../../utils/log.hpp"

namespace Roundwise::Quantization::Details {
    struct QuantizerFlags {
        std::optional<bool> quantized{};
        std::optional<bool> symmetric{};
    };

    /*
     * Quantizer defaults, read from a JSON file of the form
     *   { "defaults": { "ops": {...}, "params": {...} }, "params": { "<param>": {...} } }
     * with "True"/"False" string flags. Per-parameter entries override the
     * parameter defaults. Without a file, biases are left unquantized.
     */
    struct QuantConfig {
        bool output_quantized{true};
        bool output_symmetric{false};
        bool param_quantized{true};
        bool param_symmetric{false};
        std::map<std::string, QuantizerFlags> params{{"bias", QuantizerFlags{false, std::nullopt}}};

        [[nodiscard]] bool is_param_quantized(const std::string& name) const
        {
            const auto it = params.find(name);
            if (it != params.end() && it->second.quantized.has_value()) {
                return *it->second.quantized;
            }
            return param_quantized;
        }

        [[nodiscard]] bool is_param_symmetric(const std::string& name) const
        {
            const auto it = params.find(name);
            if (it != params.end() && it->second.symmetric.has_value()) {
                return *it->second.symmetric;
            }
            return param_symmetric;
        }
    };

    namespace Parse {
        using PropertyTree = boost::property_tree::ptree;

        [[nodiscard]] inline std::optional<bool> flag(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(PropertyTree::path_type(key, '\0'));
            if (!value) {
                return std::nullopt;
            }
            if (*value == "True" || *value == "true") {
                return true;
            }
            if (*value == "False" || *value == "false") {
                return false;
            }
            std::ostringstream message;
            message << "Invalid boolean '" << *value << "' for '" << key << "' in " << context
                    << "; expected \"True\" or \"False\".";
            throw std::invalid_argument(message.str());
        }

        inline void apply(const PropertyTree& tree, const std::string& context, QuantizerFlags& flags,
                          const std::string& quantized_key)
        {
            if (auto quantized = flag(tree, quantized_key, context)) {
                flags.quantized = quantized;
            }
            if (auto symmetric = flag(tree, "is_symmetric", context)) {
                flags.symmetric = symmetric;
            }
        }
    }

    [[nodiscard]] inline QuantConfig parse_config(const boost::property_tree::ptree& tree)
    {
        QuantConfig config{};
        config.params.clear();

        if (const auto defaults = tree.get_child_optional("defaults")) {
            if (const auto ops = defaults->get_child_optional("ops")) {
                QuantizerFlags flags{};
                Parse::apply(*ops, "defaults.ops", flags, "is_output_quantized");
                config.output_quantized = flags.quantized.value_or(config.output_quantized);
                config.output_symmetric = flags.symmetric.value_or(config.output_symmetric);
            }
            if (const auto params = defaults->get_child_optional("params")) {
                QuantizerFlags flags{};
                Parse::apply(*params, "defaults.params", flags, "is_quantized");
                config.param_quantized = flags.quantized.value_or(config.param_quantized);
                config.param_symmetric = flags.symmetric.value_or(config.param_symmetric);
            }
        }

        if (const auto params = tree.get_child_optional("params")) {
            for (const auto& [name, node] : *params) {
                auto& flags = config.params[name];
                Parse::apply(node, "params." + name, flags, "is_quantized");
            }
        }
        return config;
    }

    [[nodiscard]] inline QuantConfig load_config(const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::invalid_argument("Quantization config file '" + path.string() + "' does not exist.");
        }
        boost::property_tree::ptree tree;
        try {
            tree = ::Roundwise::Common::SaveLoad::read_json_file(path);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::invalid_argument("Malformed quantization config file '" + path.string() + "': " + error.what());
        }
        auto config = parse_config(tree);
        ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant, "Loaded quantization config '", path.string(), "'.");
        return config;
    }
}

#endif // ROUNDWISE_QUANTIZATION_DETAILS_CONFIG_HPP
