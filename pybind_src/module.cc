#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "plot.h"
#include "plot_errors.h"

namespace py = pybind11;

namespace {

// Wraps a Python callable returning a sequence of floats or None.
stripplot::ValueAccessor wrap_accessor(py::function get_values) {
    return [get_values]() -> std::optional<stripplot::ValueFrame> {
        py::gil_scoped_acquire gil;
        py::object result = get_values();
        if (result.is_none()) return std::nullopt;
        return result.cast<stripplot::ValueFrame>();
    };
}

std::vector<stripplot::RowStyle> to_row_styles(const py::list& styles) {
    std::vector<stripplot::RowStyle> out;
    for (const auto& s : styles) {
        if (py::isinstance<py::str>(s)) {
            out.emplace_back(s.cast<std::string>());
        } else {
            out.emplace_back(s.cast<std::vector<std::string>>());
        }
    }
    return out;
}

}  // namespace

PYBIND11_MODULE(stripplot_py, m) {
    m.doc() = "Python bindings for stripplot real-time strip charts";

    py::register_exception<stripplot::ConfigurationMismatch>(m, "ConfigurationMismatch", PyExc_ValueError);
    py::register_exception<stripplot::IndexOutOfRange>(m, "IndexOutOfRange", PyExc_IndexError);
    py::register_exception<stripplot::ValueCountMismatch>(m, "ValueCountMismatch", PyExc_RuntimeError);

    py::class_<stripplot::RealtimePlotter>(m, "RealtimePlotter")
        .def(py::init([](std::vector<std::pair<double, double>> ylims,
                         py::function get_values,
                         std::size_t size,
                         std::optional<std::pair<std::pair<double, double>, std::pair<double, double>>> phaselims,
                         const std::string& window_name,
                         py::list styles,
                         std::vector<std::string> ylabels,
                         std::vector<std::vector<double>> yticks,
                         std::vector<std::vector<std::string>> legends,
                         bool show_readouts,
                         int interval_msec) {
                 stripplot::PlotConfig config;
                 config.ylims = std::move(ylims);
                 config.size = size;
                 if (phaselims) {
                     config.phaselims = stripplot::PhaseLimits{phaselims->first, phaselims->second};
                 }
                 config.window_name = window_name;
                 config.styles = to_row_styles(styles);
                 config.ylabels = std::move(ylabels);
                 config.yticks = std::move(yticks);
                 config.legends = std::move(legends);
                 config.show_readouts = show_readouts;
                 config.interval_msec = interval_msec;
                 return std::make_unique<stripplot::RealtimePlotter>(std::move(config),
                                                                     wrap_accessor(std::move(get_values)));
             }),
             py::arg("ylims"),
             py::arg("get_values"),
             py::arg("size") = 100,
             py::arg("phaselims") = std::nullopt,
             py::arg("window_name") = "",
             py::arg("styles") = py::list(),
             py::arg("ylabels") = std::vector<std::string>(),
             py::arg("yticks") = std::vector<std::vector<double>>(),
             py::arg("legends") = std::vector<std::vector<std::string>>(),
             py::arg("show_readouts") = false,
             py::arg("interval_msec") = 20)
        .def("start", &stripplot::RealtimePlotter::start, py::call_guard<py::gil_scoped_release>(),
             "Opens the window and renders until it is closed.")
        // The render thread takes the GIL inside the accessor, so baseline
        // calls drop it before waiting on the engine lock.
        .def("show_baseline", py::overload_cast<long, double>(&stripplot::RealtimePlotter::show_baseline),
             py::arg("row"), py::arg("value"), py::call_guard<py::gil_scoped_release>())
        .def("show_baseline", py::overload_cast<long>(&stripplot::RealtimePlotter::show_baseline),
             py::arg("row"), py::call_guard<py::gil_scoped_release>(),
             "Shows the row's baseline again at its last value.")
        .def("hide_baseline", &stripplot::RealtimePlotter::hide_baseline, py::arg("row"),
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("is_open", &stripplot::RealtimePlotter::is_open)
        .def_property_readonly("row_count", &stripplot::RealtimePlotter::row_count);
}
