#include <QCoreApplication>
#include <QCommandLineParser>

#include "replay/ReplayHarness.hpp"
#include "common/logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("focuslens-replay"));

    QCommandLineParser parser;
    parser.addHelpOption();
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable debug trace logging.");
    parser.addOption(traceOption);
    parser.addPositionalArgument("scenarioDir", "Path to scenario directory.");
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("FOCUSLENS_TRACE") == 1;
    focuslens::logging::initLogging(QStringLiteral("focuslens-replay"), trace);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    focuslens::ReplayHarness harness;
    return harness.runScenario(args.first());
}
