#pragma once

#ifndef TRUSTREGIONRL_METRICSLOGGER_HPP
#define TRUSTREGIONRL_METRICSLOGGER_HPP

#include<cstdint>
#include<string>
#include<utility>
#include<vector>

#include"Algorithms/Algorithm.hpp"

namespace TrustRegion
{
    /**
     * @class MetricsLogger
     * @brief Collects the scalars of one iteration and writes them out together.
     *
     * dump() prints an aligned key/value table through spdlog and appends one row to
     * progress.csv in the log directory. The CSV columns are fixed by the first dump (or by
     * the header of an existing file); keys recorded later appear in the table only.
     */
    class MetricsLogger
    {
    private:
        std::string directory;
        std::vector<std::pair<std::string, float>> values;
        std::vector<std::pair<std::string, float>> lastDump;
        std::vector<std::string> columns;

        void appendCsvRow();

    public:
        /// An empty directory disables the CSV file.
        explicit MetricsLogger(std::string directory = "");

        /// Sets `key` for the current iteration, replacing an earlier value.
        void record(const std::string &key, float value);

        void record(const std::vector<UpdateDatum> &data);

        /// Writes out and clears the values recorded since the last dump.
        void dump(int64_t iteration);

        std::string csvPath() const;

        inline const std::vector<std::pair<std::string, float>> &getValues() const
        {
            return values;
        }

        /// The values written by the most recent dump().
        inline const std::vector<std::pair<std::string, float>> &getLastDump() const
        {
            return lastDump;
        }
    };
}

#endif //TRUSTREGIONRL_METRICSLOGGER_HPP
