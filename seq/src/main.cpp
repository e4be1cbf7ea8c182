#include <iostream>

#include "gif_options.h"
#include "gif_seq.h"
#include "log.h"
#include "progress.h"

std::ostream* GeneralLogger::logStream = &std::cerr;
bool GeneralLogger::verbose            = false;

int
main(int argc, char** argv) {
    const auto options = GIFSeq::Options::parseArgs(argc, argv);
    if (!options) {
        return 1;
    }

    GIFSeq::ProgressChannel channel;
    GIFSeq::ConsolePresenter presenter(channel, std::cout, options->debug);
    presenter.start();

    const bool succeeded = GIFSeq::gifSeqEncode(*options, &channel);
    presenter.wait();
    return succeeded ? 0 : 1;
}
