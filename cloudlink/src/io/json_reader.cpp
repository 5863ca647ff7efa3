#include "io/json_reader.hpp"

#include <fstream>
#include <stdexcept>

#include "io/fs_utils.hpp"

namespace cloudlink::io
{

    nlohmann::json loadJsonFile(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + path.string());
        }

        nlohmann::json data;
        in >> data;
        if (!data.is_object())
        {
            throw std::runtime_error("JSON root is not object: " + path.string());
        }
        return data;
    }

    bool saveJsonFile(const std::filesystem::path &path, const nlohmann::json &data)
    {
        return writeFileAtomic(path, data.dump(2) + "\n");
    }

} // namespace cloudlink::io
