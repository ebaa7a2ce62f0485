#ifndef ROUNDWISE_COMMON_SAVE_LOAD_HPP
#define ROUNDWISE_COMMON_SAVE_LOAD_HPP
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <nlohmann/json.hpp>

namespace Roundwise::Common::SaveLoad {
    // Configuration documents are read into a property tree.
    using PropertyTree = boost::property_tree::ptree;
    // Records Roundwise writes itself (parameter encodings). Objects keep
    // their keys sorted.
    using Json = nlohmann::json;

    inline constexpr int kJsonIndent = 4;

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }

    // `indent` spaces per level, ": " between key and value, no trailing newline.
    inline void write_json_document(const std::filesystem::path& path, const Json& document, int indent = kJsonIndent)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        stream << document.dump(indent);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to write '" << path.string() << "'.";
            throw std::runtime_error(message.str());
        }
    }

    inline Json read_json_document(const std::filesystem::path& path)
    {
        std::ifstream stream(path);
        if (!stream) {
            throw std::runtime_error("Failed to open '" + path.string() + "' for reading.");
        }
        try {
            return Json::parse(stream);
        } catch (const Json::parse_error& error) {
            std::ostringstream message;
            message << "Malformed JSON in '" << path.string() << "': " << error.what();
            throw std::runtime_error(message.str());
        }
    }
}
#endif // ROUNDWISE_COMMON_SAVE_LOAD_HPP
