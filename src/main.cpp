#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Config.h"
#include "core/Errors.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/Privilege.h"
#include "discovery/OuiClassifier.h"
#include "discovery/ScanOrchestrator.h"
#include "discovery/SystemNetworkEnvironment.h"
#include <fstream>
#include <iostream>

using namespace cam_scan;

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

    ConfigValidator validator;
    if(!validator.validate(cfg)) return 2;

    LogLevel lvl;
    if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);

    if(cfg.drop_priv){
        // ping may need CAP_NET_RAW when it is not installed setuid/file-capable
        if(!drop_capabilities(true)) Logger::instance().warn("Continuing with current privileges");
    }

    OuiClassifier classifier;
    if(!cfg.oui_file.empty() && !classifier.load_file(cfg.oui_file)){
        std::cerr << "Cannot read --oui-file: " << cfg.oui_file << "\n";
        return 2;
    }
    Logger::instance().debug("OUI tables: " + std::to_string(classifier.camera_count()) + " camera, " +
                             std::to_string(classifier.infrastructure_count()) + " infrastructure");

    SystemNetworkEnvironment env(cfg.ping_grace_seconds, cfg.arp_timeout_seconds);
    ScanOrchestrator orchestrator(env, classifier, ScanOptions::from_config(cfg));

    ScanResult result;
    try {
        result = orchestrator.run_scan(cfg.subnets);
    } catch(const InvalidCidr& ex){
        std::cerr << ex.what() << "\n";
        return 2;
    } catch(const std::exception& ex){
        Logger::instance().error(std::string("Scan failed: ") + ex.what());
        return 3;
    }

    JSONWriter writer;
    std::string json = writer.write(result, cfg);
    if(cfg.output_file.empty()) {
        std::cout << json;
        if(!json.empty() && json.back() != '\n') std::cout << "\n";
    } else {
        std::ofstream ofs(cfg.output_file);
        if(!ofs){
            Logger::instance().error("Cannot open output file: " + cfg.output_file);
            return 3;
        }
        ofs << json;
        if(!ofs){
            Logger::instance().error("Failed writing output file: " + cfg.output_file);
            return 3;
        }
    }

    if(cfg.fail_on_empty && result.devices.empty()) return 1;
    return 0;
}
