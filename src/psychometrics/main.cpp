#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <boost/program_options.hpp>

#include "PsychometricExceptions.h"
#include "adaptive/AbilityEstimator.h"
#include "adaptive/AdaptiveEngine.h"
#include "adaptive/ItemInformation.h"
#include "adaptive/ItemSelector.h"
#include "analysis/ItemQualityAnalyzer.h"
#include "analysis/ItemStatisticsJob.h"
#include "analysis/QualityFlagController.h"
#include "config/EngineConfiguration.h"
#include "diagnostics/StreamQualityFlagLogger.h"
#include "reliability/PrecisionCalculator.h"
#include "reliability/ReliabilityEstimator.h"
#include "reporting/ReportAggregator.h"
#include "reporting/ReportFormatter.h"
#include "reporting/ReportJsonSerializer.h"
#include "repository/InMemoryRepositories.h"
#include "simulation/PopulationSimulator.h"

namespace po = boost::program_options;

using namespace psychometrics;

namespace
{
    void printUsage(const po::options_description& desc)
    {
        std::cout << "Usage: psychometrics_cli [options]" << std::endl << std::endl;
        std::cout << "Simulates adaptive test sessions against a generated item pool" << std::endl;
        std::cout << "and prints the item discrimination and reliability reports." << std::endl << std::endl;
        std::cout << desc << std::endl;
    }
}

int main(int argc, char* argv[])
{
    try
    {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("config,c", po::value<std::string>(), "INI configuration file")
            ("examinees,n", po::value<std::size_t>(), "Number of simulated examinees")
            ("pool-size", po::value<std::size_t>(), "Number of generated items")
            ("retest-share", po::value<double>(), "Share of examinees who sit a retest")
            ("retest-days", po::value<int>(), "Days between first session and retest")
            ("seed", po::value<std::uint64_t>(), "Random seed")
            ("max-items", po::value<std::size_t>(), "Override adaptive.max_items")
            ("se-threshold", po::value<double>(), "Override adaptive.se_threshold")
            ("information-model", po::value<std::string>(), "Override adaptive.information_model (1PL, 2PL, 3PL)")
            ("min-sessions", po::value<std::size_t>(), "Override reliability.min_sessions")
            ("min-retest-pairs", po::value<std::size_t>(), "Override reliability.min_retest_pairs")
            ("store-metrics", "Append the computed reliability metrics to the history")
            ("sessions", "Print one line per completed session")
            ("item", po::value<ItemId>(), "Also print the discrimination detail of this item")
            ("json", "Write the reports as JSON")
            ("output,o", po::value<std::string>(), "Write the reports to this file instead of stdout");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            printUsage(desc);
            return 0;
        }

        config::EngineConfiguration configuration;
        if (vm.count("config"))
            configuration = config::EngineConfigurationFileReader(vm["config"].as<std::string>()).readConfigurationFile();

        if (vm.count("max-items"))
            configuration.adaptive.maxItems = vm["max-items"].as<std::size_t>();
        if (vm.count("se-threshold"))
            configuration.adaptive.seThreshold = vm["se-threshold"].as<double>();
        if (vm.count("information-model"))
            configuration.adaptive.informationModel =
                config::parseInformationModel(vm["information-model"].as<std::string>());
        if (vm.count("min-sessions"))
            configuration.reliability.minSessions = vm["min-sessions"].as<std::size_t>();
        if (vm.count("min-retest-pairs"))
            configuration.reliability.minRetestPairs = vm["min-retest-pairs"].as<std::size_t>();
        configuration.validate();

        simulation::SimulationSettings simulationSettings;
        if (vm.count("examinees"))
            simulationSettings.examinees = vm["examinees"].as<std::size_t>();
        if (vm.count("pool-size"))
            simulationSettings.poolSize = vm["pool-size"].as<std::size_t>();
        if (vm.count("retest-share"))
            simulationSettings.retestShare = vm["retest-share"].as<double>();
        if (vm.count("retest-days"))
            simulationSettings.retestDelayDays = vm["retest-days"].as<int>();
        if (vm.count("seed"))
            simulationSettings.seed = vm["seed"].as<std::uint64_t>();

        std::ostream& log = std::cerr;
        simulation::ManualClock clock(utils::currentTimestamp());
        const utils::Clock now = clock.asClock();

        repository::InMemoryItemRepository items;
        repository::InMemoryResponseRepository responses;
        repository::InMemorySessionRepository sessions;
        repository::InMemoryReliabilityMetricRepository metrics;

        diagnostics::StreamQualityFlagLogger flagLogger(log);
        analysis::ItemQualityAnalyzer analyzer(responses, configuration.discrimination.minResponses);
        analysis::QualityFlagController flagController(items, flagLogger,
                                                       configuration.discrimination.minResponses, now);
        analysis::ItemStatisticsJob statisticsJob(analyzer, flagController, items, responses, log);

        reliability::ReliabilityEstimator reliabilityEstimator(responses, configuration.reliability, log, now);
        reliability::PrecisionCalculator precision(configuration.precision);

        std::unique_ptr<adaptive::IItemInformationModel> model =
            adaptive::makeInformationModel(configuration.adaptive.informationModel);
        adaptive::ItemSelector selector(*model, log);
        adaptive::EapAbilityEstimator estimator(*model,
                                                configuration.adaptive.priorMean,
                                                configuration.adaptive.priorSD,
                                                configuration.adaptive.quadraturePoints);
        adaptive::AdaptiveEngine engine(items, responses, sessions, selector, estimator,
                                        reliabilityEstimator, precision, configuration.adaptive, log, now);

        std::mt19937_64 poolRng(simulationSettings.seed);
        const auto pool = simulation::PopulationSimulator::generateItemPool(simulationSettings, poolRng);
        for (const auto& s : pool)
            items.addItem(s.item);

        log << "[Main] " << pool.size() << " items, " << simulationSettings.examinees
            << " examinees, information model " << model->name() << std::endl;

        simulation::PopulationSimulator simulator(engine, statisticsJob, clock, simulationSettings, log);
        const simulation::SimulationSummary summary = simulator.run(pool);

        std::ofstream outputFile;
        if (vm.count("output"))
        {
            outputFile.open(vm["output"].as<std::string>());
            if (!outputFile)
                throw InvalidInputException("Cannot open output file " + vm["output"].as<std::string>());
        }
        std::ostream& out = outputFile.is_open() ? static_cast<std::ostream&>(outputFile) : std::cout;

        if (vm.count("sessions"))
        {
            for (SessionId id = 1;; ++id)
            {
                auto session = sessions.findSession(id);
                if (!session)
                    break;
                if (session->status != SessionStatus::Completed)
                    continue;
                out << "session " << id << " user " << session->userId
                    << " items=" << session->itemsAdministered
                    << " score=" << session->score.value_or(0);
                if (session->confidenceInterval)
                    out << " ci=[" << session->confidenceInterval->lower << ", "
                        << session->confidenceInterval->upper << "]";
                out << std::endl;
            }
            out << std::endl;
        }

        out << "Completed sessions: " << summary.sessionsCompleted
            << " (retests " << summary.retestSessions << ")" << std::endl;
        for (const auto& entry : summary.stoppingReasons)
            out << "  " << toString(entry.first) << ": " << entry.second << std::endl;
        out << "Sessions with confidence interval: " << summary.sessionsWithInterval << std::endl;
        out << std::endl;

        reporting::ReportAggregator aggregator(items, metrics, reliabilityEstimator, flagController,
                                               configuration, log, now);
        const auto discrimination = aggregator.discriminationReport();
        const auto reliabilityReport =
            aggregator.reliabilityReport(std::nullopt, std::nullopt, vm.count("store-metrics") > 0);

        if (vm.count("json"))
        {
            out << reporting::ReportJsonSerializer::discriminationReportToJson(discrimination) << std::endl;
            out << reporting::ReportJsonSerializer::reliabilityReportToJson(reliabilityReport) << std::endl;
            if (vm.count("item"))
                out << reporting::ReportJsonSerializer::discriminationDetailToJson(
                           aggregator.discriminationDetail(vm["item"].as<ItemId>())) << std::endl;
            return 0;
        }

        reporting::ReportFormatter::writeDiscriminationReport(out, discrimination);
        out << std::endl;
        reporting::ReportFormatter::writeReliabilityReport(out, reliabilityReport);

        if (vm.count("item"))
        {
            out << std::endl;
            reporting::ReportFormatter::writeDiscriminationDetail(
                out, aggregator.discriminationDetail(vm["item"].as<ItemId>()));
        }

        return 0;
    }
    catch (const po::error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const PsychometricException& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
