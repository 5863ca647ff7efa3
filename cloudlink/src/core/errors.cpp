#include "core/errors.hpp"

#include <sstream>

namespace cloudlink
{

    const char *errorKindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::None:
            return "None";
        case ErrorKind::Validation:
            return "Validation";
        case ErrorKind::Ledger:
            return "Ledger";
        case ErrorKind::Busy:
            return "Busy";
        case ErrorKind::Move:
            return "Move";
        case ErrorKind::Link:
            return "Link";
        case ErrorKind::Verification:
            return "Verification";
        case ErrorKind::Rollback:
            return "Rollback";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::NotJunction:
            return "NotJunction";
        case ErrorKind::Command:
            return "Command";
        }
        return "Unknown";
    }

    std::string Error::describe() const
    {
        std::ostringstream out;
        out << errorKindName(kind) << " error: " << message;
        if (!paths.empty())
        {
            out << " [";
            for (size_t i = 0; i < paths.size(); ++i)
            {
                if (i > 0)
                {
                    out << ", ";
                }
                out << paths[i].string();
            }
            out << "]";
        }
        return out.str();
    }

    Status Status::failure(ErrorKind kind, std::string message, std::vector<std::filesystem::path> paths)
    {
        Error error;
        error.kind = kind;
        error.message = std::move(message);
        error.paths = std::move(paths);
        return Status(std::move(error));
    }

} // namespace cloudlink
