/**
 * @file ledger_source.cpp
 * @brief Implementation of ledger sources and their factory
 */

#include "data/ledger_source.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace budget
{

    FileLedgerSource::FileLedgerSource(const std::string &path) : path_(path)
    {
        if (path_.empty())
        {
            throw std::invalid_argument("File ledger source requires a path");
        }
    }

    LedgerSnapshot FileLedgerSource::fetch() const
    {
        return LedgerLoader::load_ledger(path_);
    }

    // LedgerSourceFactory implementation
    std::string LedgerSourceFactory::normalize_type(const std::string &type)
    {
        std::string normalized = type;

        std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                       { return std::tolower(c); });
        return normalized;
    }

    std::unique_ptr<LedgerSource> LedgerSourceFactory::create(const LedgerSourceConfig &config)
    {
        std::string type = normalize_type(config.source);

        if (type == "file")
        {
            return std::make_unique<FileLedgerSource>(config.path);
        }
        if (type == "demo")
        {
            return std::make_unique<DemoLedgerSource>();
        }

        throw std::invalid_argument(
            "Unknown ledger source '" + config.source + "' (expected one of: file, demo)");
    }

    std::vector<std::string> LedgerSourceFactory::available_sources()
    {
        return {"file", "demo"};
    }

} // namespace budget
