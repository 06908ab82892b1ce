/**
 * @file ledger_source.hpp
 * @brief Abstract interface for ledger snapshot providers
 *
 * A LedgerSource delivers one complete LedgerSnapshot per fetch. The
 * snapshot cache calls fetch() once per refresh cycle and aggregates the
 * result; sources never see the aggregation step.
 */

#pragma once

#include "data/ledger.hpp"
#include "data/ledger_loader.hpp"

#include <memory>
#include <string>
#include <vector>

namespace budget
{

    /**
     * @class LedgerSource
     * @brief Abstract base class for ledger providers
     *
     * Usage Example:
     * @code
     * auto source = LedgerSourceFactory::create(config.ledger);
     * LedgerSnapshot snapshot = source->fetch();
     * @endcode
     */
    class LedgerSource
    {
    public:
        virtual ~LedgerSource() = default;

        /**
         * @brief Fetch a complete ledger snapshot
         * @throws std::runtime_error if the ledger cannot be obtained
         */
        virtual LedgerSnapshot fetch() const = 0;

        /**
         * @brief Get the name of the source
         */
        virtual std::string get_name() const = 0;
    };

    /**
     * @class FileLedgerSource
     * @brief Reads the ledger from a JSON export on disk
     */
    class FileLedgerSource : public LedgerSource
    {
    public:
        explicit FileLedgerSource(const std::string &path);

        LedgerSnapshot fetch() const override;
        std::string get_name() const override { return "file:" + path_; }

        const std::string &path() const { return path_; }

    private:
        std::string path_;
    };

    /**
     * @class DemoLedgerSource
     * @brief Serves the fixed demonstration ledger
     */
    class DemoLedgerSource : public LedgerSource
    {
    public:
        LedgerSnapshot fetch() const override { return LedgerLoader::demo_snapshot(); }
        std::string get_name() const override { return "demo"; }
    };

    /**
     * @class LedgerSourceFactory
     * @brief Creates ledger sources from configuration
     */
    class LedgerSourceFactory
    {
    public:
        /**
         * @brief Create a source from the "ledger" config section
         * @throws std::invalid_argument for an unknown source type or a file source without a path
         */
        static std::unique_ptr<LedgerSource> create(const LedgerSourceConfig &config);

        static std::vector<std::string> available_sources();

    private:
        static std::string normalize_type(const std::string &type);
    };

} // namespace budget
