// reconfusion_sim.cpp
// Command-line runner: advances a seeded run for N ticks and exports telemetry and the audit chain.

#include <cstdint>
#include <exception>
#include <fstream>
#include <iomanip>  // For std::setprecision
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>

#include "audit_chain.hpp"
#include "clarity_risk.hpp"
#include "engine_state.hpp"
#include "fusion_config.hpp"
#include "logging.hpp"
#include "scenario_presets.hpp"
#include "step_engine.hpp"

namespace po = boost::program_options;

namespace {

const char* const kCsvHeader =
    "tick,utc_timestamp,mission_time_s,mission_stage_code,mission_stage_label,mission_stage_tick,"
    "mach,velocity_mps,altitude_m,q_kpa,thermal_index,g_load,link_latency_ms,imu_drift_deg_s,"
    "lat,lon,nav_altitude_m,threat_index,civ_density,comms_loss,vision_hot_ratio,"
    "clarity,risk,predicted_risk,state,envelope_pressure,"
    "cc_combined,cc_nav_conf,cc_comms_conf,cc_vision_conf,cc_clarity_factor,cc_threat_factor,"
    "fusion_conf,fusion_surprise,used_meas_count,fusion_nis,fusion_consistent";

void writeCsvRow(std::ostream& out, const reconfusion::Telemetry& telemetry) {
    const reconfusion::Telemetry::Values& v = telemetry.values();
    out << v.tick << ',' << v.utc_timestamp << ',' << v.mission_time_s << ','
        << v.mission_stage_code << ',' << v.mission_stage_label << ',' << v.mission_stage_tick << ','
        << v.mach << ',' << v.velocity_mps << ',' << v.altitude_m << ',' << v.q_kpa << ','
        << v.thermal_index << ',' << v.g_load << ',' << v.link_latency_ms << ',' << v.imu_drift_deg_s << ','
        << v.lat << ',' << v.lon << ',' << v.nav_altitude_m << ','
        << v.threat_index << ',' << v.civ_density << ',' << v.comms_loss << ',' << v.vision_hot_ratio << ','
        << v.clarity << ',' << v.risk << ',' << v.predicted_risk << ','
        << reconfusion::toString(v.state) << ',' << v.envelope_pressure << ','
        << v.cc_combined << ',' << v.cc_nav_conf << ',' << v.cc_comms_conf << ','
        << v.cc_vision_conf << ',' << v.cc_clarity_factor << ',' << v.cc_threat_factor << ','
        << v.fusion_conf << ',' << v.fusion_surprise << ',' << v.used_meas_count << ','
        << v.fusion_nis << ',' << (v.fusion_consistent ? 1 : 0) << '\n';
}

std::ofstream openOutput(const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open '" + path + "' for writing.");
    }
    out << std::setprecision(10);
    return out;
}

int run(int argc, char** argv) {
    po::options_description desc("reconfusion_sim options");
    desc.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>(), "FusionConfig YAML file")
        ("ticks,n", po::value<std::int64_t>()->default_value(120), "Number of ticks to simulate")
        ("seed,s", po::value<std::uint64_t>(), "Run seed (wall clock when omitted)")
        ("env", po::value<std::string>()->default_value(reconfusion::presets::kDefaultEnvironment),
         "Environment profile")
        ("envelope", po::value<std::string>()->default_value(reconfusion::presets::kDefaultEnvelope),
         "Flight envelope")
        ("ao", po::value<std::string>()->default_value(reconfusion::presets::kDefaultArea),
         "Area of operation")
        ("thresholds", po::value<std::string>()->default_value(reconfusion::presets::kDefaultThresholds),
         "Alert threshold preset")
        ("strategy", po::value<std::string>()->default_value(reconfusion::FusionEngine::kDefaultStrategy),
         "Fusion strategy (weighted, kalman)")
        ("telemetry-csv", po::value<std::string>(), "Write telemetry history as CSV")
        ("audit-jsonl", po::value<std::string>(), "Write the audit chain as JSON lines")
        ("log-level", po::value<std::string>()->default_value("info"),
         "trace, debug, info, warning, error or fatal")
        ("dump-config", po::value<std::string>(), "Write the effective FusionConfig as YAML");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    reconfusion::initLogging(reconfusion::parseSeverity(vm["log-level"].as<std::string>()));

    reconfusion::FusionConfig config;
    if (vm.count("config")) {
        config = reconfusion::FusionConfig::fromYaml(vm["config"].as<std::string>());
    }
    if (vm.count("dump-config")) {
        config.saveYaml(vm["dump-config"].as<std::string>());
        BOOST_LOG_TRIVIAL(info) << "Effective config written to " << vm["dump-config"].as<std::string>();
    }

    const std::int64_t ticks = vm["ticks"].as<std::int64_t>();
    if (ticks < 0) {
        throw std::runtime_error("--ticks must be >= 0.");
    }

    std::optional<std::uint64_t> seed;
    if (vm.count("seed")) {
        seed = vm["seed"].as<std::uint64_t>();
    }

    reconfusion::EngineState state(config, seed);
    state.env_name = vm["env"].as<std::string>();
    state.envelope_name = vm["envelope"].as<std::string>();
    state.ao_name = vm["ao"].as<std::string>();
    state.threshold_name = vm["thresholds"].as<std::string>();
    state.fusion_strategy_name = vm["strategy"].as<std::string>();

    const reconfusion::ThresholdPreset& preset = reconfusion::presets::threshold(state.threshold_name);

    BOOST_LOG_TRIVIAL(info) << "Run " << state.run_id << " seed=" << state.rng_seed
                            << " env='" << state.env_name << "' envelope='" << state.envelope_name
                            << "' ao='" << state.ao_name << "' strategy='" << state.fusion_strategy_name << "'";

    // Streamed exports keep every tick even when the in-memory history evicts
    std::optional<std::ofstream> csv;
    std::optional<std::ofstream> jsonl;
    if (vm.count("telemetry-csv")) {
        csv = openOutput(vm["telemetry-csv"].as<std::string>());
        *csv << kCsvHeader << '\n';
    }
    if (vm.count("audit-jsonl")) {
        jsonl = openOutput(vm["audit-jsonl"].as<std::string>());
    }

    reconfusion::StepEngine engine(config);
    for (std::int64_t i = 0; i < ticks; ++i) {
        const reconfusion::Telemetry& telemetry = engine.advance(state);
        const reconfusion::Telemetry::Values& v = telemetry.values();

        std::cout << "tick " << v.tick << " " << v.mission_stage_label
                  << std::fixed << std::setprecision(2)
                  << " clarity=" << v.clarity << " risk=" << v.risk
                  << " conf=" << v.fusion_conf << " used=" << v.used_meas_count
                  << " state=" << reconfusion::toString(v.state)
                  << std::defaultfloat << "\n";

        for (const auto& alert : reconfusion::evaluateAlerts(telemetry, config, preset, state.staleSensors())) {
            if (alert.severity == reconfusion::AlertSeverity::CRITICAL) {
                BOOST_LOG_TRIVIAL(error) << "[" << alert.code << "] tick " << v.tick << ": " << alert.message;
            } else {
                BOOST_LOG_TRIVIAL(warning) << "[" << alert.code << "] tick " << v.tick << ": " << alert.message;
            }
        }

        if (csv) {
            writeCsvRow(*csv, telemetry);
        }
        if (jsonl) {
            *jsonl << reconfusion::detail::canonicalJson(state.audit_chain.back().toJson()) << '\n';
        }
    }

    if (csv && !*csv) {
        throw std::runtime_error("Failed writing telemetry CSV.");
    }
    if (jsonl && !*jsonl) {
        throw std::runtime_error("Failed writing audit JSONL.");
    }

    BOOST_LOG_TRIVIAL(info) << "Completed " << state.tick << " ticks; last audit hash "
                            << (state.audit_chain.empty() ? std::string("-") : state.audit_chain.back().sha256());
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const po::error& e) {
        std::cerr << "reconfusion_sim: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(fatal) << "reconfusion_sim: " << e.what();
        return 1;
    }
}
