#include<algorithm>
#include<filesystem>
#include<fstream>
#include<sstream>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../include/MetricsLogger.hpp"

namespace TrustRegion
{
    MetricsLogger::MetricsLogger(std::string directory)
        : directory(std::move(directory))
    {
    }

    std::string MetricsLogger::csvPath() const
    {
        if (directory.empty())
        {
            return "";
        }
        return (std::filesystem::path(directory) / "progress.csv").string();
    }

    void MetricsLogger::record(const std::string &key, float value)
    {
        auto existing = std::find_if(values.begin(), values.end(),
                                     [&](const std::pair<std::string, float> &entry) { return entry.first == key; });
        if (existing != values.end())
        {
            existing->second = value;
        }
        else
        {
            values.emplace_back(key, value);
        }
    }

    void MetricsLogger::record(const std::vector<UpdateDatum> &data)
    {
        for (const auto &datum : data)
        {
            record(datum.name, datum.value);
        }
    }

    void MetricsLogger::dump(int64_t iteration)
    {
        record("Iteration", static_cast<float>(iteration));

        size_t keyWidth = 0;
        for (const auto &entry : values)
        {
            keyWidth = std::max(keyWidth, entry.first.size());
        }
        const std::string border(keyWidth + 19, '-');
        spdlog::info(border);
        for (const auto &entry : values)
        {
            spdlog::info("| {:<{}} | {:>12.6g} |", entry.first, keyWidth, entry.second);
        }
        spdlog::info(border);

        if (!directory.empty())
        {
            appendCsvRow();
        }
        lastDump = std::move(values);
        values.clear();
    }

    void MetricsLogger::appendCsvRow()
    {
        auto path = csvPath();
        std::error_code errorCode;
        std::filesystem::create_directories(directory, errorCode);

        bool writeHeader = false;
        if (columns.empty())
        {
            std::ifstream existing(path);
            std::string header;
            if (existing && std::getline(existing, header) && !header.empty())
            {
                std::stringstream stream(header);
                std::string column;
                while (std::getline(stream, column, ','))
                {
                    columns.push_back(column);
                }
            }
            else
            {
                for (const auto &entry : values)
                {
                    columns.push_back(entry.first);
                }
                writeHeader = true;
            }
        }

        std::ofstream file(path, writeHeader ? std::ios::trunc : std::ios::app);
        if (!file)
        {
            spdlog::warn("Could not open {} for writing", path);
            return;
        }
        if (writeHeader)
        {
            file << fmt::format("{}\n", fmt::join(columns, ","));
        }
        std::vector<std::string> row;
        for (const auto &column : columns)
        {
            auto entry = std::find_if(values.begin(), values.end(),
                                      [&](const std::pair<std::string, float> &value) { return value.first == column; });
            row.push_back(entry == values.end() ? "" : fmt::format("{}", entry->second));
        }
        file << fmt::format("{}\n", fmt::join(row, ","));
    }

    TEST_CASE("MetricsLogger")
    {
        auto directory = std::filesystem::temp_directory_path() / "trustregion_metrics_test";
        std::filesystem::remove_all(directory);

        auto readLines = [&]() {
            std::ifstream file(directory / "progress.csv");
            std::vector<std::string> lines;
            std::string line;
            while (std::getline(file, line))
            {
                lines.push_back(line);
            }
            return lines;
        };

        SUBCASE("Columns are fixed by the first dump")
        {
            MetricsLogger logger(directory.string());
            logger.record("MeanKL", 0.5f);
            logger.record({{"Entropy", 0.25f}, {"MeanKL", 0.125f}});
            logger.dump(0);

            logger.record("Entropy", 2.f);
            logger.record("Extra", 1.f);
            logger.dump(1);

            auto lines = readLines();
            REQUIRE(lines.size() == 3);
            CHECK(lines[0] == "MeanKL,Entropy,Iteration");
            CHECK(lines[1] == "0.125,0.25,0");
            CHECK(lines[2] == ",2,1");
            CHECK(logger.getValues().empty());
            CHECK(logger.getLastDump().size() == 3);
        }

        SUBCASE("An existing file keeps its header")
        {
            {
                MetricsLogger logger(directory.string());
                logger.record("Reward", 1.f);
                logger.dump(0);
            }
            MetricsLogger resumed(directory.string());
            resumed.record("Reward", 3.f);
            resumed.dump(1);

            auto lines = readLines();
            REQUIRE(lines.size() == 3);
            CHECK(lines[0] == "Reward,Iteration");
            CHECK(lines[2] == "3,1");
        }

        SUBCASE("Without a directory nothing is written")
        {
            MetricsLogger logger;
            logger.record("Reward", 1.f);
            logger.dump(0);
            CHECK(logger.csvPath().empty());
            CHECK(!std::filesystem::exists(directory / "progress.csv"));
        }

        std::filesystem::remove_all(directory);
    }
}
