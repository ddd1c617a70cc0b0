/* Dump a CMRR physio log session */

#include <QCoreApplication>
#include <QDebug>

#include "logger.h"
#include "dumpphysio.h"

int main(int argc, char *argv[]) {

    QCoreApplication a(argc, argv);
    QStringList args = a.arguments();

    DumpOptions options;
    if (!parseArguments(args, options)) {
        for (const auto & line : usageText(args[0])) {
            qWarning().noquote() << line;
        }
        exit(DUMP_USAGE_ERROR);
    }

    initializeLogger(!options.quiet);
    if (!options.logfile.isEmpty()) {
        logToFile(options.logfile);
    }

    int result = dumpSession(options);

    shutdownLogger();
    return result;
}
