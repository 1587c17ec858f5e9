#ifndef SKULD_COMMON_SAVE_LOAD_HPP
#define SKULD_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace Skuld::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline const PropertyTree& get_child(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                std::ostringstream message;
                message << "Missing section '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *child;
        }

        // Overwrites `target` only when `key` is present; malformed values are reported with their key.
        template <class T>
        void read_optional(const PropertyTree& tree, const std::string& key, T& target, const std::string& context)
        {
            const auto node = tree.get_child_optional(key);
            if (!node) {
                return;
            }
            try {
                target = node->get_value<T>();
            } catch (const boost::property_tree::ptree_bad_data&) {
                std::ostringstream message;
                message << "Malformed value for '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    if constexpr (std::is_same_v<T, bool>) {
                        values.push_back(static_cast<bool>(child.second.get_value<int>()));
                    } else {
                        values.push_back(child.second.get_value<T>());
                    }
                } catch (const boost::property_tree::ptree_bad_data&) {
                    std::ostringstream message;
                    message << "Invalid array element in " << context;
                    throw std::runtime_error(message.str());
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to parse JSON file '" + path.string() + "': " + error.what());
        }
        return tree;
    }

    inline std::string to_json_string(const PropertyTree& tree)
    {
        std::ostringstream stream;
        boost::property_tree::write_json(stream, tree, true);
        return stream.str();
    }

    inline PropertyTree from_json_string(const std::string& text, const std::string& context)
    {
        PropertyTree tree;
        std::istringstream stream(text);
        try {
            boost::property_tree::read_json(stream, tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to parse JSON for " + context + ": " + error.what());
        }
        return tree;
    }
}
#endif // SKULD_COMMON_SAVE_LOAD_HPP
