#include "output.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <system_error>

#include "devices.h"
#include "global.h"

using namespace std;


bool output::initializeScenarioDirectory(const filesystem::path& output_path, unsigned long scenario_id, filesystem::path& scenario_dir) {
    stringstream current_scenario_str;
    current_scenario_str << "S";
    current_scenario_str << setw(4) << setfill('0') << scenario_id;
    filesystem::path dirpath = output_path / current_scenario_str.str();
    // create the base output dir and the subfolder for the current scenario, if it does not exist
    error_code ec;
    filesystem::create_directories(dirpath, ec);
    if (ec) {
        cerr << "Error: Output directory " << dirpath << " cannot be created: " << ec.message() << endl;
        return false;
    }
    scenario_dir = dirpath;
    return true;
}

bool output::outputLPFile(const BaseMILPModel& model, const filesystem::path& filepath) {
    cout << "Writing model with " << model.get_n_variables() << " variables and "
         << model.get_n_constraints() << " constraints to " << filepath << endl;
    return model.write_lp(filepath);
}

bool output::outputHouseholdSummary(const filesystem::path& output_dir, const IndexRegistry& registry, const vector<Household>& households) {
    filesystem::path output_path = output_dir / "households.csv";
    ofstream ofs(output_path, std::ofstream::out);
    if (!ofs.is_open()) {
        cerr << "Error: Output file " << output_path << " cannot be opened!" << endl;
        return false;
    }
    ofs << "Household,Number of devices,Number of variables,Number of constraints,Device kinds\n";
    for (const Household& hh : households) {
        // count devices per kind, e.g. "Battery:1;ShiftableLoad:2"
        map<string, unsigned int> kinds;
        for (const Device& d : hh.devices)
            kinds[get_device_kind_name(d)]++;
        ofs << hh.label << ",";
        ofs << hh.devices.size() << ",";
        ofs << registry.count_variables_of_household(hh.label)   << ",";
        ofs << registry.count_constraints_of_household(hh.label) << ",";
        bool first = true;
        for (auto& [kind, n] : kinds) {
            if (!first) ofs << ";";
            ofs << kind << ":" << n;
            first = false;
        }
        ofs << "\n";
    }
    ofs.close();
    return true;
}

bool output::outputSchedule(
    const filesystem::path& output_dir,
    const IndexRegistry& registry,
    const vector<Household>& households,
    unsigned long n_steps,
    const vector<double>& x)
{
    if (x.size() != registry.get_n_variables()) {
        cerr << "Error: The solution contains " << x.size() << " values, but the model has "
             << registry.get_n_variables() << " variables. No schedule is written." << endl;
        return false;
    }
    filesystem::path output_path = output_dir / "schedule.csv";
    ofstream ofs(output_path, std::ofstream::out);
    if (!ofs.is_open()) {
        cerr << "Error: Output file " << output_path << " cannot be opened!" << endl;
        return false;
    }
    ofs << "t,totalLoad";
    for (const Household& hh : households)
        ofs << ",netLoad_" << hh.label;
    ofs << "\n";
    ofs << std::setprecision(10);
    for (unsigned long t = 0; t < n_steps; t++) {
        ofs << t << ",";
        ofs << x[ registry.lookup_variable(IndexKey::Aggregator(Field::TotalLoad, (long) t)) ];
        for (const Household& hh : households)
            ofs << "," << x[ registry.lookup_variable(IndexKey::Household(hh.label, Field::NetLoad, (long) t)) ];
        ofs << "\n";
    }
    ofs.close();
    return true;
}

void output::outputRuntimeInformation(const filesystem::path& output_dir, long seconds_setup, long seconds_main_run) {
    filesystem::path output_path = output_dir / "runtime-information.txt";
    ofstream ofs(output_path, std::ofstream::out);
    if (!ofs.is_open()) {
        cerr << "Warning: Run-time information cannot be written to " << output_path << endl;
        return;
    }
    time_t t_start = chrono::system_clock::to_time_t(global::time_of_run_start);
    ofs << "Run started at:         " << std::put_time(std::localtime(&t_start), "%F %T") << "\n";
    ofs << "Setup and data loading: " << seconds_setup    << "s\n";
    ofs << "Main run:               " << seconds_main_run << "s\n";
    ofs.close();
}
