#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "ContestResultsCsvReader.h"
#include "RaterConfigurationFileReader.h"
#include "RosterCsvReader.h"
#include "FitConfiguration.h"
#include "FitObserver.h"
#include "PlackettLuceFitter.h"
#include "StrengthReport.h"
#include "RankingException.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;

using namespace plrank;

namespace
{
  constexpr int kExitOk = 0;
  constexpr int kExitError = 1;
  constexpr int kExitIllPosed = 2;
  constexpr int kExitDidNotConverge = 3;
}

void printUsage(const po::options_description& desc) {
    std::cout << "plrank - Plackett-Luce strength ratings from contest finishing orders\n\n";
    std::cout << "Usage: plrank <results-file> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nResults file formats:\n";
    std::cout << "  contest    Contest,Competitor,Finish (one row per finisher)\n";
    std::cout << "  fieldsize  Contest,Competitor,Finish,FieldSize (blocks of FieldSize rows)\n";

    std::cout << "\nExit status:\n";
    std::cout << "  0  ratings computed\n";
    std::cout << "  1  invalid input or configuration\n";
    std::cout << "  2  competitors split into disjoint sets, no ratings exist\n";
    std::cout << "  3  iteration limit reached before convergence\n";

    std::cout << "\nExamples:\n";
    std::cout << "  plrank results.csv\n";
    std::cout << "  plrank tourney.csv --format fieldsize --roster players.csv -E\n";
    std::cout << "  plrank results.csv --config rater.csv --max-iterations 500 -v --log-file\n";
}

void applyCommandLineOverrides(const po::variables_map& vm, FitConfiguration& configuration) {
    if (vm.count("tolerance")) {
        configuration.setTolerance(vm["tolerance"].as<double>());
    }
    if (vm.count("no-check")) {
        configuration.setCheckPrecondition(false);
    }
    if (vm.count("no-normalize")) {
        configuration.setNormalize(false);
    }
    if (vm.count("max-iterations")) {
        configuration.setMaxIterations(vm["max-iterations"].as<unsigned int>());
    }
    if (vm.count("formulation")) {
        configuration.setFormulation(formulationFromString(vm["formulation"].as<std::string>()));
    }
    if (vm.count("parallel")) {
        configuration.setParallel(true);
    }
    if (vm.count("verbose")) {
        configuration.setVerbose(true);
    }
}

int runRater(const po::variables_map& vm, std::ostream& out) {
    const std::string resultsFile = vm["results-file"].as<std::string>();
    const std::string format = vm["format"].as<std::string>();
    const bool excludeInactive = vm.count("exclude-inactive") > 0;

    std::shared_ptr<FitConfiguration> configuration;
    if (vm.count("config")) {
        RaterConfigurationFileReader configReader(vm["config"].as<std::string>());
        configuration = configReader.readConfigurationFile();
    } else {
        configuration = std::make_shared<FitConfiguration>();
    }
    applyCommandLineOverrides(vm, *configuration);

    CompetitorRoster<std::string> roster;
    if (vm.count("roster")) {
        RosterCsvReader rosterReader(vm["roster"].as<std::string>());
        roster = rosterReader.readFile();
    } else if (excludeInactive) {
        std::cerr << "Warning: --exclude-inactive has no effect without --roster" << std::endl;
    }

    auto reader = createResultsReader(format, resultsFile);
    reader->readFile();

    if (configuration->isVerbose()) {
        out << "Read " << reader->getNumContests() << " contests from " << resultsFile << std::endl;
    }

    std::shared_ptr<diagnostics::IFitObserver> observer;
    if (configuration->isVerbose()) {
        observer = std::make_shared<diagnostics::StreamFitObserver>(out);
    } else {
        observer = std::make_shared<diagnostics::NullFitObserver>();
    }

    PlackettLuceFitter<std::string> fitter(*configuration, observer);
    auto result = fitter.fit(reader->getRankings());

    if (result.isIllPosed()) {
        std::cerr << "Error: competitors form " << *result.getComponentCount()
                  << " disjoint sets; maximum likelihood strengths do not exist." << std::endl;
        std::cerr << "Rerun with --no-check and --max-iterations to iterate anyway." << std::endl;
        return kExitIllPosed;
    }

    StrengthReport<std::string> report(result, roster, excludeInactive);
    report.write(out);

    if (result.getStatus() == FitStatus::DID_NOT_CONVERGE) {
        std::cerr << "Warning: no convergence after " << result.getIterations()
                  << " iterations (last L2 difference " << result.getFinalDifference() << ")" << std::endl;
        return kExitDidNotConverge;
    }

    return kExitOk;
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("results-file", po::value<std::string>(), "Contest results file")
            ("format,f", po::value<std::string>()->default_value("contest"), "Results file format: contest or fieldsize")
            ("roster,r", po::value<std::string>(), "Roster file (Competitor,Label,Active) for labels and the active flag")
            ("exclude-inactive,E", "Leave inactive competitors out of the report")
            ("config,c", po::value<std::string>(), "Rater configuration file (Parameter,Value)")
            ("tolerance,t", po::value<double>(), "L2 convergence tolerance")
            ("no-check", "Skip the strong-connectivity check")
            ("no-normalize", "Do not rescale strengths to sum to one after each step")
            ("max-iterations,m", po::value<unsigned int>(), "Give up after this many MM iterations")
            ("formulation", po::value<std::string>(), "MM update formulation: reference or vectorized")
            ("parallel,p", "Compute per-contest terms on a thread pool")
            ("verbose,v", "Print connectivity verdict and per-iteration diagnostics")
            ("log-file,l", po::value<std::string>()->implicit_value(""), "Mirror output to a log file (default name if none given)");

        po::positional_options_description positional;
        positional.add("results-file", 1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return kExitOk;
        }

        if (!vm.count("results-file")) {
            std::cerr << "Error: no results file given" << std::endl << std::endl;
            printUsage(desc);
            return kExitError;
        }

        if (vm.count("log-file")) {
            std::string logFileName = vm["log-file"].as<std::string>();
            if (logFileName.empty()) {
                logFileName = utils::createRatingLogFileName(vm["results-file"].as<std::string>());
            }

            std::ofstream logFile(logFileName);
            if (!logFile.is_open()) {
                std::cerr << "Error: cannot open log file " << logFileName << std::endl;
                return kExitError;
            }

            utils::TeeStream tee(std::cout, logFile);
            int status = runRater(vm, tee);
            tee.flush();
            return status;
        }

        return runRater(vm, std::cout);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    } catch (const ResultsFileException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    } catch (const RaterConfigurationException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    } catch (const FitConfigurationException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    } catch (const RankingException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return kExitError;
    }
}
