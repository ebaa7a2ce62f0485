#ifndef ROUNDWISE_ADAROUND_DETAILS_ENCODINGS_HPP
#define ROUNDWISE_ADAROUND_DETAILS_ENCODINGS_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../common/save_load.hpp"
#include "../../quantization/quantization.hpp"
#include "../../utils/log.hpp"
#include "tensor_quantizer.hpp"

namespace Roundwise::Adaround::Details {
    struct ParamEncoding {
        ::Roundwise::Quantization::Encoding encoding{};
        bool is_symmetric{false};
        ::Roundwise::Quantization::DataType dtype{::Roundwise::Quantization::DataType::Int};
    };

    using ParamEncodings = std::map<std::string, ParamEncoding>;

    [[nodiscard]] inline std::filesystem::path encodings_path(const std::filesystem::path& directory, const std::string& filename_prefix)
    {
        return directory / (filename_prefix + ".encodings");
    }

    // One "<layer>.weight" entry per layer whose weight went through Adaround.
    [[nodiscard]] inline ParamEncodings collect_encodings(const ::Roundwise::Quantization::QuantizationSimModel& sim)
    {
        ParamEncodings encodings;
        for (const auto& [layer, wrapper] : sim.wrappers()) {
            const auto* quantizer = dynamic_cast<const AdaroundTensorQuantizer*>(wrapper->param_quantizer("weight"));
            if (quantizer == nullptr || !quantizer->encoding().has_value()) {
                continue;
            }
            ParamEncoding entry{};
            entry.encoding = *quantizer->encoding();
            entry.is_symmetric = quantizer->is_symmetric();
            entry.dtype = quantizer->data_type();
            encodings.emplace(layer->name + ".weight", entry);
        }
        return encodings;
    }

    // {"<layer>.weight": [{"bitwidth": ..., "dtype": ..., "is_symmetric": "True"|"False",
    //                      "max": ..., "min": ..., "offset": ..., "scale": ...}], ...}
    [[nodiscard]] inline ::Roundwise::Common::SaveLoad::Json to_json(const ParamEncodings& encodings)
    {
        using Json = ::Roundwise::Common::SaveLoad::Json;

        auto root = Json::object();
        for (const auto& [name, entry] : encodings) {
            Json fields = {
                {"bitwidth", entry.encoding.bitwidth},
                {"dtype", std::string(::Roundwise::Quantization::dtype_name(entry.dtype))},
                {"is_symmetric", entry.is_symmetric ? "True" : "False"},
                {"max", entry.encoding.max},
                {"min", entry.encoding.min},
                {"offset", entry.encoding.offset},
                {"scale", entry.encoding.delta},
            };
            root[name] = Json::array({std::move(fields)});
        }
        return root;
    }

    inline std::filesystem::path export_encodings(const std::filesystem::path& directory,
                                                  const std::string& filename_prefix,
                                                  const ::Roundwise::Quantization::QuantizationSimModel& sim)
    {
        const auto file = encodings_path(directory, filename_prefix);
        const auto encodings = collect_encodings(sim);
        ::Roundwise::Common::SaveLoad::write_json_document(file, to_json(encodings));
        ::Roundwise::Log::info(::Roundwise::Log::Area::kQuant, "Exported ", encodings.size(),
                               " parameter encodings to '", file.string(), "'.");
        return file;
    }

    [[nodiscard]] inline ParamEncodings load_encodings(const std::filesystem::path& file)
    {
        const auto root = ::Roundwise::Common::SaveLoad::read_json_document(file);
        if (!root.is_object()) {
            throw std::runtime_error("Encodings file '" + file.string() + "' does not hold an object.");
        }
        ParamEncodings encodings;
        for (const auto& [name, list] : root.items()) {
            if (!list.is_array() || list.empty()) {
                throw std::runtime_error("Encoding entry '" + name + "' in '" + file.string() + "' is empty.");
            }
            const auto& fields = list.front();
            try {
                ParamEncoding entry{};
                entry.encoding.bitwidth = fields.at("bitwidth").get<int>();
                entry.encoding.min = fields.at("min").get<double>();
                entry.encoding.max = fields.at("max").get<double>();
                entry.encoding.delta = fields.at("scale").get<double>();
                entry.encoding.offset = fields.at("offset").get<std::int64_t>();
                entry.is_symmetric = fields.at("is_symmetric").get<std::string>() == "True";
                entry.dtype = fields.at("dtype").get<std::string>() == "int" ? ::Roundwise::Quantization::DataType::Int
                                                                             : ::Roundwise::Quantization::DataType::Float;
                encodings.emplace(name, entry);
            } catch (const ::Roundwise::Common::SaveLoad::Json::exception& error) {
                std::ostringstream message;
                message << "Malformed encoding entry '" << name << "' in '" << file.string() << "': " << error.what();
                throw std::runtime_error(message.str());
            }
        }
        return encodings;
    }
}

#endif // ROUNDWISE_ADAROUND_DETAILS_ENCODINGS_HPP
