// ─────────────────────────────────────────────────────────────────────────────
// homectl — Python bindings (pybind11)
// ─────────────────────────────────────────────────────────────────────────────
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "homectl/homectl.h"

#include <memory>

namespace py = pybind11;
using namespace homectl;

// ── Helper: controller bundled with its logger and manual clock ─────────────
// Python drives time explicitly; there is no background thread.
namespace {

LogConfig binding_log_config(bool verbose) {
    LogConfig cfg;
    cfg.to_stderr = verbose;
    cfg.level     = LogLevel::Info;
    return cfg;
}

struct PyHome {
    Logger                       log;
    std::shared_ptr<ManualClock> clock;
    HomeController               home;

    PyHome(const ControllerConfig& cfg, std::shared_ptr<IValueSource> source,
           bool verbose)
        : log(binding_log_config(verbose))
        , clock(std::make_shared<ManualClock>())
        , home(cfg, std::move(source), clock, log) {}
};

} // anonymous namespace

PYBIND11_MODULE(homectl_py, m) {
    m.doc() = "homectl home automation controller — Python bindings";

    // ── Enums ───────────────────────────────────────────────────────────────
    py::enum_<Status>(m, "Status")
        .value("OK",                Status::OK)
        .value("InvalidParameter",  Status::InvalidParameter)
        .value("AlreadyRunning",    Status::AlreadyRunning)
        .value("NotRunning",        Status::NotRunning)
        .value("SensorUnavailable", Status::SensorUnavailable)
        .value("IoError",           Status::IoError)
        .value("InternalError",     Status::InternalError);

    py::enum_<DeviceKind>(m, "DeviceKind")
        .value("Light",      DeviceKind::Light)
        .value("Thermostat", DeviceKind::Thermostat);

    py::enum_<DeviceStatus>(m, "DeviceStatus")
        .value("Off", DeviceStatus::Off)
        .value("On",  DeviceStatus::On);

    py::enum_<SensorKind>(m, "SensorKind")
        .value("Temperature", SensorKind::Temperature)
        .value("Light",       SensorKind::Light)
        .value("Motion",      SensorKind::Motion);

    py::enum_<DeviceField>(m, "DeviceField")
        .value("Status",            DeviceField::Status)
        .value("Brightness",        DeviceField::Brightness)
        .value("TargetTemperature", DeviceField::TargetTemperature);

    py::enum_<ThermostatDecision>(m, "ThermostatDecision")
        .value("Cooling", ThermostatDecision::Cooling)
        .value("Heating", ThermostatDecision::Heating)
        .value("Stable",  ThermostatDecision::Stable);

    py::enum_<LightingAction>(m, "LightingAction")
        .value("NoAction",     LightingAction::None)
        .value("TurnOnDimmed", LightingAction::TurnOnDimmed)
        .value("TurnOff",      LightingAction::TurnOff);

    // ── Device ──────────────────────────────────────────────────────────────
    py::class_<DeviceEvent>(m, "DeviceEvent")
        .def_readonly("device_id", &DeviceEvent::device_id)
        .def_readonly("name",      &DeviceEvent::name)
        .def_readonly("field",     &DeviceEvent::field)
        .def_readonly("status",    &DeviceEvent::status)
        .def_readonly("value",     &DeviceEvent::value);

    py::class_<Device>(m, "Device")
        .def_static("light", &Device::light,
                    py::arg("id"), py::arg("name"),
                    py::arg("brightness") = kDefaultBrightness)
        .def_static("thermostat", &Device::thermostat,
                    py::arg("id"), py::arg("name"),
                    py::arg("target_temperature") = kDefaultTargetTemperature)
        .def_property_readonly("id",     &Device::id)
        .def_property_readonly("name",   &Device::name)
        .def_property_readonly("kind",   &Device::kind)
        .def_property_readonly("status", &Device::status)
        .def_property_readonly("is_on",  &Device::is_on)
        .def_property_readonly("brightness",         &Device::brightness)
        .def_property_readonly("target_temperature", &Device::target_temperature)
        .def("turn_on",  &Device::turn_on)
        .def("turn_off", &Device::turn_off)
        .def("try_set_brightness",         &Device::try_set_brightness)
        .def("try_set_target_temperature", &Device::try_set_target_temperature)
        .def("__repr__", [](const Device& d) {
            return std::string("Device(") + d.id() + ", " +
                   device_kind_name(d.kind()) + ", " +
                   device_status_name(d.status()) + ")";
        });

    // ── Value sources ───────────────────────────────────────────────────────
    py::class_<IValueSource, std::shared_ptr<IValueSource>>(m, "ValueSource");

    py::class_<RandomValueSource, IValueSource,
               std::shared_ptr<RandomValueSource>>(m, "RandomValueSource")
        .def(py::init<uint32_t>(), py::arg("seed") = 0);

    py::class_<ScriptedReading>(m, "ScriptedReading")
        .def(py::init<>())
        .def(py::init([](double t, int lux, bool motion) {
            return ScriptedReading{t, lux, motion};
        }), py::arg("temperature"), py::arg("lux"), py::arg("motion"))
        .def_readwrite("temperature", &ScriptedReading::temperature)
        .def_readwrite("lux",         &ScriptedReading::lux)
        .def_readwrite("motion",      &ScriptedReading::motion);

    // Typed pushes: Python bool is an int, so a variant overload would be
    // ambiguous.
    py::class_<ScriptedValueSource, IValueSource,
               std::shared_ptr<ScriptedValueSource>>(m, "ScriptedValueSource")
        .def(py::init<>())
        .def(py::init<const std::vector<ScriptedReading>&>())
        .def("push", py::overload_cast<const ScriptedReading&>(
                         &ScriptedValueSource::push))
        .def("push_temperature", [](ScriptedValueSource& s, double v) {
            s.push(SensorKind::Temperature, SensorValue{v});
        })
        .def("push_lux", [](ScriptedValueSource& s, int v) {
            s.push(SensorKind::Light, SensorValue{v});
        })
        .def("push_motion", [](ScriptedValueSource& s, bool v) {
            s.push(SensorKind::Motion, SensorValue{v});
        })
        .def("pending", &ScriptedValueSource::pending);

    // ── Rules ───────────────────────────────────────────────────────────────
    py::class_<RuleConfig>(m, "RuleConfig")
        .def(py::init<>())
        .def_readwrite("thermostat_band_c", &RuleConfig::thermostat_band_c)
        .def_readwrite("lux_threshold",     &RuleConfig::lux_threshold)
        .def_readwrite("motion_brightness", &RuleConfig::motion_brightness)
        .def_readwrite("motion_timeout_s",  &RuleConfig::motion_timeout_s);

    py::class_<LightingDecision>(m, "LightingDecision")
        .def_readonly("refresh_motion_time", &LightingDecision::refresh_motion_time)
        .def_readonly("action",              &LightingDecision::action);

    m.def("decide_thermostat", &decide_thermostat,
          py::arg("current"), py::arg("target"), py::arg("cfg") = RuleConfig{});
    m.def("decide_lighting", &decide_lighting,
          py::arg("motion"), py::arg("lux"), py::arg("light_status"),
          py::arg("seconds_since_motion"), py::arg("cfg") = RuleConfig{});

    // ── Series ──────────────────────────────────────────────────────────────
    py::class_<TimeSeriesRecord>(m, "TimeSeriesRecord")
        .def_readonly("elapsed_seconds", &TimeSeriesRecord::elapsed_seconds)
        .def_readonly("temperature",     &TimeSeriesRecord::temperature)
        .def_readonly("light_intensity", &TimeSeriesRecord::light_intensity)
        .def_readonly("motion_flag",     &TimeSeriesRecord::motion_flag);

    m.def("render_svg", [](const std::vector<TimeSeriesRecord>& series,
                           const std::string& path) {
        return SvgChartSink(path).render(series);
    });

    // ── HomeController ──────────────────────────────────────────────────────
    py::class_<ControllerConfig>(m, "ControllerConfig")
        .def(py::init<>())
        .def_readwrite("interval_s",                 &ControllerConfig::interval_s)
        .def_readwrite("rules",                      &ControllerConfig::rules)
        .def_readwrite("initial_brightness",         &ControllerConfig::initial_brightness)
        .def_readwrite("initial_target_temperature", &ControllerConfig::initial_target_temperature);

    py::class_<PyHome>(m, "HomeController")
        .def(py::init([](std::shared_ptr<IValueSource> source,
                         const ControllerConfig& config, bool verbose) {
                 return std::make_unique<PyHome>(config, std::move(source), verbose);
             }),
             py::arg("source"), py::arg("config") = ControllerConfig{},
             py::arg("verbose") = false)
        .def("tick", [](PyHome& h) { h.home.tick(); })
        .def("advance", [](PyHome& h, double seconds) { h.clock->advance(seconds); },
             py::arg("seconds"))
        .def_property_readonly("light", [](PyHome& h) -> Device& {
            return h.home.light();
        }, py::return_value_policy::reference_internal)
        .def_property_readonly("thermostat", [](PyHome& h) -> Device& {
            return h.home.thermostat();
        }, py::return_value_policy::reference_internal)
        .def("device_ids", [](const PyHome& h) { return h.home.device_ids(); })
        .def("sensor_ids", [](const PyHome& h) { return h.home.sensor_ids(); })
        .def_property_readonly("ticks", [](const PyHome& h) { return h.home.ticks(); })
        .def("export_series", [](const PyHome& h) { return h.home.export_series(); })
        .def("update_rules", [](PyHome& h, const RuleConfig& r) { h.home.update_rules(r); })
        .def_property_readonly("rules", [](const PyHome& h) { return h.home.rules(); })
        .def("on_device_event", [](PyHome& h, DeviceListener cb) {
            h.home.on_device_event(std::move(cb));
        });
}
