#pragma once
#include <string>

#include "bondspread/DataOrdering.hpp"

namespace bondspread {

    /**
     * Loads one (time, value) series from a CSV with a single header row.
     * - ',' or ';' delimiters, quoted fields, decimal commas, NBSP padding
     * - timestamps ISO or European (DD.MM.YYYY [HH:MM[:SS]]), normalised
     *   to "YYYY-MM-DD HH:MM:SS"
     * - time_col == "*" picks the first column whose name contains
     *   "time" or "date" (case-insensitive)
     * - rows with an unreadable time or value are skipped
     * Result is sorted by time; a later duplicate timestamp wins.
     * Throws std::runtime_error for a missing file or column.
     */
    TimeSeries load_series_csv(
        const std::string& filepath,
        const std::string& time_col,
        const std::string& value_col
    );

    // <data_dir>/<ISIN>.csv
    std::string bond_series_path(const std::string& data_dir, const std::string& isin);

}
