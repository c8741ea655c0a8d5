#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include "HedgeEstimator.h"
#include "MultiWindowRunner.h"
#include "PairAligner.h"
#include "ParallelExecutors.h"
#include "PriceSourceFactory.h"
#include "RunConfiguration.h"
#include "StatArbException.h"
#include "StationarityTester.h"
#include "reporting/PerformanceReporter.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;

using namespace statarb;
using spreadrunner::reporting::PerformanceReporter;
using spreadrunner::utils::TeeStream;

namespace
{

void printUsage(const po::options_description& desc)
{
    std::cout << "Usage: spreadrunner --config <run file> --instruments <instrument file> [options]" << std::endl;
    std::cout << desc << std::endl;
}

int runStudy(const po::variables_map& vm, std::ostream& out)
{
    RunConfiguration config = RunConfigurationFileReader::readRunFile(vm["config"].as<std::string>());

    const std::string sourceName = boost::to_lower_copy(vm["source"].as<std::string>());
    const bool isCsv = (sourceName == "csv");

    InstrumentConfiguration instruments;
    if (vm.count("instruments"))
        instruments = RunConfigurationFileReader::readInstrumentFile(vm["instruments"].as<std::string>(), isCsv);
    else if (isCsv)
        throw ConfigurationException("--instruments is required for the csv source");

    std::string apiToken;
    if (sourceName == "oanda")
    {
        if (!vm.count("api-config"))
            throw ConfigurationException("--api-config is required for the " + sourceName + " source");
        apiToken = PriceSourceFactory::getApiTokenFromFile(vm["api-config"].as<std::string>(), sourceName);
    }

    std::shared_ptr<PriceSource> source =
        PriceSourceFactory::getPriceSource(sourceName, instruments.getCsvSpecifications(), apiToken,
                                           vm["environment"].as<std::string>(), instruments.getCurrencies());

    out << "Pair " << config.getTickerA() << " / " << config.getTickerB()
        << " in " << config.getBaseCurrency() << ", " << config.getInterval().toString()
        << " bars, " << config.getDateRange().toString() << std::endl;

    PairAligner aligner(config.getBaseCurrency(), &out);
    AlignedPair pair = aligner.load(*source, config.getTickerA(), config.getTickerB(),
                                    config.getDateRange(), config.getInterval(), instruments.getFxTickers());
    PerformanceReporter::writeAlignedHead(out, pair);

    HedgeRatioResult hedge = HedgeEstimator(config.getAddIntercept()).estimate(pair);
    PerformanceReporter::writeHedgeRatio(out, hedge);

    NumericSeries spread = computeSpread(pair, hedge.getRatio(), hedge.getIntercept());

    AdfResult adf = StationarityTester().test(spread);
    PerformanceReporter::writeStationarity(out, adf);

    auto executor = concurrency::makeExecutor(vm["threads"].as<std::size_t>());
    MultiWindowRunner runner(config.getNumStd(), config.getFee(), executor, &out);
    std::map<unsigned int, BacktestResult> results = runner.run(spread, config.getWindows());

    PerformanceReporter::writeWindowSummary(out, results);

    boost::optional<unsigned int> best = PerformanceReporter::getBestWindow(results);
    if (best)
    {
        const BacktestResult& bestResult = results.at(*best);
        out << std::endl << "Best window by total pnl: " << *best
            << " (" << bestResult.getStats().getTotalPnl() << ")" << std::endl;
        PerformanceReporter::writeTradeList(out, bestResult);
    }

    out.flush();
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show this help message")
        ("config,c", po::value<std::string>(), "Run configuration file")
        ("instruments,i", po::value<std::string>(), "Instrument file mapping symbols to data files and currencies")
        ("source,s", po::value<std::string>()->default_value("csv"), "Price source: csv, oanda or yahoo")
        ("api-config", po::value<std::string>(), "CSV file of Source,Token rows")
        ("environment", po::value<std::string>()->default_value("practice"), "OANDA environment: practice or live")
        ("threads,t", po::value<std::size_t>()->default_value(0), "Worker threads for the window backtests (0 = all cores)")
        ("log,l", po::value<std::string>(), "Also write the console output to this file");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(desc);
        return 1;
    }

    if (vm.count("help"))
    {
        printUsage(desc);
        return 0;
    }

    if (!vm.count("config"))
    {
        std::cerr << "Error: --config is required" << std::endl;
        printUsage(desc);
        return 1;
    }

    std::ofstream logFile;
    std::unique_ptr<TeeStream> tee;
    if (vm.count("log"))
    {
        logFile.open(vm["log"].as<std::string>());
        if (!logFile.is_open())
        {
            std::cerr << "Error: cannot open log file " << vm["log"].as<std::string>() << std::endl;
            return 1;
        }
        tee.reset(new TeeStream(std::cout, logFile));
    }

    std::ostream& out = tee ? static_cast<std::ostream&>(*tee) : std::cout;

    try
    {
        return runStudy(vm, out);
    }
    catch (const StatArbException& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
