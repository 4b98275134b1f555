/*
 *
 * setup_and_dataloading.h
 *
 * Contains all code required for reading the configuration
 * and loading the time series data
 *
 * */

#ifndef SETUP_AND_DATALOADING_H
#define SETUP_AND_DATALOADING_H

#include <ostream>
#include <string>
#include <vector>

#include "instance_generation.h"


/**
 * This namespace contains all functions required for loading the
 * scenario file and the time series data
 **/
namespace configld {

    /**
     * Complete time series as stored in the database, one value per time step
     */
    struct RawTimeSeries {
        std::vector<double> hoep;        ///< Column prices.HOEP
        std::vector<double> tou;         ///< Column prices.TOU
        std::vector<double> wind;        ///< Column production.WIND
        std::vector<double> solar;       ///< Column production.SOLAR
        std::vector<double> demand;      ///< Column demand.OntDemand
        std::vector<double> temperature; ///< Column temperature.Temperature
    };

    bool load_config_file(unsigned long scenario_id, const std::string& filepath); ///< Load the config file, that is passed as command line argument

    /**
     * Loads all time series from the database.
     * Every table must contain the time steps 0, 1, 2, ... in column TimestepID without gaps.
     *
     * @return: Returns false (and prints an error message) if the file cannot be opened or a query fails
     */
    bool load_time_series_from_database(const std::string& filepath, RawTimeSeries& raw);

    /**
     * Normalizes load, wind and solar by their mean over the complete data
     * and cuts out the time steps [t_begin, t_begin + t_horizon).
     *
     * @return: Returns false (and prints an error message) if the data does not fit
     */
    bool prepare_time_series(const RawTimeSeries& raw, unsigned long t_begin, unsigned long t_horizon, instance::TimeSeriesData& data);

    /**
     * @brief Outputs the current configuration and all parameter settings to the specified output stream.
     *
     * @param out Reference to an output stream where the configuration should be written.
     */
    void output_variable_values(std::ostream& out);

}




#endif
