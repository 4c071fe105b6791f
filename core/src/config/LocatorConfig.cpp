#include "ct/config/LocatorConfig.hpp"
#include "ct/core/Errors.hpp"
#include "ct/locator/AngleFormatterLocator.hpp"
#include "ct/locator/ScalarFormatterLocator.hpp"
#include "ct/units/Units.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ct {

static ConfigResult fail(const std::string& code, const std::string& message) {
  ConfigResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || it->value.IsNull()) return nullptr;
  return &it->value;
}

static std::vector<double> readValues(const rapidjson::Value& v) {
  if (!v.IsArray()) throw ConfigurationError("values must be an array of numbers");
  std::vector<double> out;
  out.reserve(v.Size());
  for (const auto& e : v.GetArray()) {
    if (!e.IsNumber()) throw ConfigurationError("values must be an array of numbers");
    out.push_back(e.GetDouble());
  }
  return out;
}

static Angle readAngle(const rapidjson::Value& v) {
  if (v.IsNumber()) {
    throw SpacingTypeError("spacing should be an angle quantity with units of angle");
  }
  if (!v.IsObject()) throw ConfigurationError("spacing must be an object {value, unit}");

  const auto* value = getMember(v, "value");
  const auto* unit = getMember(v, "unit");
  if (!value || !value->IsNumber()) {
    throw ConfigurationError("spacing.value must be a number");
  }
  if (!unit || !unit->IsString()) {
    throw SpacingTypeError("spacing should be an angle quantity with units of angle");
  }

  UnitKind kind;
  if (!parseUnitName(unit->GetString(), kind)) {
    throw ConfigurationError(std::string("unknown unit: ") + unit->GetString());
  }
  return Angle(value->GetDouble(), kind);
}

static std::unique_ptr<FormatterLocator> makeLocator(const rapidjson::Value& obj,
                                                     bool angle,
                                                     const DiagnosticHandler& handler) {
  const auto* values = getMember(obj, "values");
  const auto* number = getMember(obj, "number");
  const auto* spacing = getMember(obj, "spacing");

  std::unique_ptr<FormatterLocator> fl;
  if (angle) {
    auto a = std::make_unique<AngleFormatterLocator>();
    if (handler) a->setDiagnosticHandler(handler);
    if (spacing) a->setSpacing(readAngle(*spacing));
    fl = std::move(a);
  } else {
    auto s = std::make_unique<ScalarFormatterLocator>();
    if (handler) s->setDiagnosticHandler(handler);
    if (spacing) {
      if (!spacing->IsNumber()) throw ConfigurationError("spacing must be a number");
      s->setSpacing(spacing->GetDouble());
    }
    fl = std::move(s);
  }

  if (values) fl->setValues(readValues(*values));
  if (number) {
    if (!number->IsInt()) throw ConfigurationError("number must be an integer");
    fl->setNumber(number->GetInt());
  }

  if (const auto* format = getMember(obj, "format")) {
    if (!format->IsString()) throw ConfigurationError("format must be a string");
    fl->setFormat(format->GetString());
  }
  return fl;
}

ConfigResult buildFormatterLocator(const rapidjson::Value& obj,
                                   DiagnosticHandler handler) {
  if (!obj.IsObject()) return fail("BAD_CONFIG", "config must be a JSON object");

  std::string kind = "angle";
  if (const auto* k = getMember(obj, "kind")) {
    if (!k->IsString()) return fail("BAD_CONFIG", "kind must be a string");
    kind = k->GetString();
  }
  if (kind != "angle" && kind != "scalar") {
    return fail("UNKNOWN_KIND", "Unknown kind: " + kind);
  }

  int given = (getMember(obj, "values") ? 1 : 0) + (getMember(obj, "number") ? 1 : 0) +
              (getMember(obj, "spacing") ? 1 : 0);
  if (given > 1) {
    return fail("CONFIG_CONFLICT", "At most one of values/number/spacing can be specified");
  }

  ConfigResult r;
  try {
    r.locator = makeLocator(obj, kind == "angle", handler);
  } catch (const FormatParseError& e) {
    return fail("INVALID_FORMAT", e.what());
  } catch (const SpacingTypeError& e) {
    return fail("SPACING_TYPE", e.what());
  } catch (const ConfigurationError& e) {
    return fail("BAD_CONFIG", e.what());
  }
  return r;
}

ConfigResult buildFormatterLocatorJson(const std::string& jsonText,
                                       DiagnosticHandler handler) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());
  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_CONFIG", "invalid JSON object");
  }
  return buildFormatterLocator(d, std::move(handler));
}

std::string serializeFormatterLocator(const FormatterLocator& fl) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("kind", rapidjson::Value(fl.kind(), alloc), alloc);

  if (fl.hasFormat()) {
    doc.AddMember("format", rapidjson::Value(fl.formatString().c_str(), alloc), alloc);
  }

  const TickMode& mode = fl.mode();
  if (const auto* v = std::get_if<TickValues>(&mode)) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (double x : v->values) arr.PushBack(x, alloc);
    doc.AddMember("values", arr, alloc);
  } else if (const auto* n = std::get_if<TickCount>(&mode)) {
    doc.AddMember("number", n->count, alloc);
  } else if (const auto* s = std::get_if<TickSpacing>(&mode)) {
    if (std::string(fl.kind()) == "angle") {
      rapidjson::Value sp(rapidjson::kObjectType);
      sp.AddMember("value", s->spacing, alloc);
      sp.AddMember("unit", rapidjson::Value(unitName(UnitKind::Degree), alloc), alloc);
      doc.AddMember("spacing", sp, alloc);
    } else {
      doc.AddMember("spacing", s->spacing, alloc);
    }
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace ct
