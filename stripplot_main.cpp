// stripplot_main.cpp
// Live strip charts from a synthetic sine source or a serial port

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include "latest_values.h"
#include "plot.h"
#include "serial_producer.h"
#include "sine_producer.h"

namespace {

struct Options {
    std::string serial_port;
    int baud = 115200;
    double ymin = 0.0;
    double ymax = 10000.0;
    bool range_given = false;
    std::size_t size = 100;
    int interval_msec = 20;
    bool phase = false;
    bool readout = false;
    std::string title;
};

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--serial PORT] [--baud N] [--range MIN MAX] [--size N]"
                 " [--interval MS] [--phase] [--readout] [--title TEXT]" << std::endl;
}

Options parse_args(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto need = [&](int n) {
            if (i + n >= argc) throw std::invalid_argument("missing value for " + arg);
        };
        if (arg == "--serial") {
            need(1);
            opt.serial_port = argv[++i];
        } else if (arg == "--baud") {
            need(1);
            opt.baud = std::stoi(argv[++i]);
        } else if (arg == "--range") {
            need(2);
            opt.ymin = std::stod(argv[++i]);
            opt.ymax = std::stod(argv[++i]);
            opt.range_given = true;
        } else if (arg == "--size") {
            need(1);
            opt.size = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "--interval") {
            need(1);
            opt.interval_msec = std::stoi(argv[++i]);
        } else if (arg == "--phase") {
            opt.phase = true;
        } else if (arg == "--readout") {
            opt.readout = true;
        } else if (arg == "--title") {
            need(1);
            opt.title = argv[++i];
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
    return opt;
}

int run_serial(const Options& opt) {
    using namespace stripplot;

    LatestValues slot;
    PlotConfig config;
    config.ylims = {{opt.ymin, opt.ymax}};
    config.size = opt.size;
    config.window_name = opt.title.empty() ? "Serial input" : opt.title;
    config.yticks = {{opt.ymin, opt.ymax}};
    config.styles = {"b-"};
    config.show_readouts = opt.readout;
    config.interval_msec = opt.interval_msec;

    RealtimePlotter plotter(config, slot.accessor());

    SerialProducerConfig serial;
    serial.port = opt.serial_port;
    serial.baud = opt.baud;
    SerialProducer producer(slot, serial);
    if (!producer.start()) {
        return EXIT_FAILURE;
    }

    plotter.start();
    producer.stop();
    return EXIT_SUCCESS;
}

int run_sine(const Options& opt) {
    using namespace stripplot;

    LatestValues slot;
    PlotConfig config;
    double lo = opt.range_given ? opt.ymin : -1.0;
    double hi = opt.range_given ? opt.ymax : +1.0;
    config.ylims = {{lo, hi}, {lo, hi}};
    config.size = opt.size;
    config.window_name = opt.title.empty() ? "Sinewave demo" : opt.title;
    config.yticks = {{-1, 0, +1}, {-1, 0, +1}};
    config.styles = {"r--", "b-"};
    config.ylabels = {"Slow", "Fast"};
    config.show_readouts = opt.readout;
    config.interval_msec = opt.interval_msec;
    if (opt.phase) {
        config.phaselims = PhaseLimits{{-1.2, 1.2}, {-1.2, 1.2}};
    }

    RealtimePlotter plotter(config, slot.accessor());

    SineProducerConfig sine;
    sine.rows = 2;
    sine.size = opt.size;
    sine.phase_pair = opt.phase;
    SineProducer producer(slot, sine);
    producer.start();

    plotter.start();
    producer.stop();
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    Options opt;
    try {
        opt = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        return opt.serial_port.empty() ? run_sine(opt) : run_serial(opt);
    } catch (const std::exception& e) {
        std::cerr << "stripplot: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
