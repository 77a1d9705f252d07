// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/Extractor.h>
#include <algorithm>
#include <cstring>
#include <optional>
#include <variant>

namespace Envoy::Extractor {

namespace {

using missing_fields_t = std::vector<std::string>;

class FieldReader {
public:
    FieldReader(JsonObjectConst entry, char const* category)
        : _entry(entry)
        , _category(category) { }

    // absent and non-numeric fields read as zero
    template<typename T>
    T get(char const* key)
    {
        JsonVariantConst value = _entry[key];
        if (!value.is<T>()) {
            _missingFields.push_back(std::string(_category) + "." + key);
            return 0;
        }
        return value.as<T>();
    }

    template<typename T>
    T getFloored(char const* key)
    {
        return std::max<T>(get<T>(key), 0);
    }

    missing_fields_t takeMissingFields() { return std::move(_missingFields); }

private:
    JsonObjectConst _entry;
    char const* _category;
    missing_fields_t _missingFields;
};

struct Unrecognized { };

struct MeteredProduction {
    ProductionMetrics Metrics;
    missing_fields_t MissingFields;
};

struct TotalConsumption {
    ConsumptionMetrics Metrics;
    missing_fields_t MissingFields;
};

struct NetConsumption {
    float PowerW;
    missing_fields_t MissingFields;
};

using production_entry_t = std::variant<Unrecognized, MeteredProduction>;
using consumption_entry_t = std::variant<Unrecognized, TotalConsumption, NetConsumption>;

bool hasType(JsonObjectConst entry, char const* key, char const* type)
{
    JsonVariantConst discriminator = entry[key];
    return discriminator.is<char const*>()
        && strcmp(discriminator.as<char const*>(), type) == 0;
}

production_entry_t decodeProduction(JsonObjectConst entry)
{
    if (!hasType(entry, "type", MeteredProductionType)) {
        return Unrecognized{};
    }

    FieldReader reader(entry, MeteredProductionType);
    MeteredProduction res;
    res.Metrics.PowerW = reader.getFloored<float>("wNow");
    res.Metrics.EnergyTodayWh = reader.getFloored<double>("whToday");
    res.Metrics.EnergyLastSevenDaysWh = reader.getFloored<double>("whLastSevenDays");
    res.Metrics.EnergyLifetimeWh = reader.getFloored<double>("whLifetime");
    res.MissingFields = reader.takeMissingFields();
    return res;
}

consumption_entry_t decodeConsumption(JsonObjectConst entry)
{
    if (hasType(entry, "measurementType", TotalConsumptionType)) {
        FieldReader reader(entry, TotalConsumptionType);
        TotalConsumption res;
        res.Metrics.PowerW = reader.getFloored<float>("wNow");
        res.Metrics.EnergyTodayWh = reader.getFloored<double>("whToday");
        res.MissingFields = reader.takeMissingFields();
        return res;
    }

    if (hasType(entry, "measurementType", NetConsumptionType)) {
        FieldReader reader(entry, NetConsumptionType);
        NetConsumption res;
        res.PowerW = reader.get<float>("wNow");
        res.MissingFields = reader.takeMissingFields();
        return res;
    }

    return Unrecognized{};
}

// the first entry of each category wins, later ones are dropped
class ConsumptionAccumulator {
public:
    explicit ConsumptionAccumulator(missing_fields_t& missingFields)
        : _missingFields(missingFields) { }

    void operator()(Unrecognized const&) { }

    void operator()(TotalConsumption& entry)
    {
        if (Total) { return; }
        Total = entry.Metrics;
        keepMissingFields(entry.MissingFields);
    }

    void operator()(NetConsumption& entry)
    {
        if (NetPowerW) { return; }
        NetPowerW = entry.PowerW;
        keepMissingFields(entry.MissingFields);
    }

    std::optional<ConsumptionMetrics> Total;
    std::optional<float> NetPowerW;

private:
    void keepMissingFields(missing_fields_t const& fields)
    {
        _missingFields.insert(_missingFields.end(), fields.cbegin(), fields.cend());
    }

    missing_fields_t& _missingFields;
};

} // namespace

Result extract(JsonDocument const& doc)
{
    Result res;

    bool productionFound = false;
    for (JsonObjectConst entry : doc["production"].as<JsonArrayConst>()) {
        auto decoded = decodeProduction(entry);
        auto pMetered = std::get_if<MeteredProduction>(&decoded);
        if (!pMetered) { continue; }

        res.Production = pMetered->Metrics;
        res.MissingFields = std::move(pMetered->MissingFields);
        productionFound = true;
        break;
    }

    if (!productionFound) {
        res.MissingFields.push_back(MeteredProductionType);
    }

    ConsumptionAccumulator acc(res.MissingFields);
    for (JsonObjectConst entry : doc["consumption"].as<JsonArrayConst>()) {
        auto decoded = decodeConsumption(entry);
        std::visit(acc, decoded);
    }

    if (acc.Total) {
        res.Consumption = *acc.Total;
    } else {
        res.MissingFields.push_back(TotalConsumptionType);
    }

    if (acc.NetPowerW) {
        res.NetPowerW = *acc.NetPowerW;
    } else {
        res.MissingFields.push_back(NetConsumptionType);
    }

    return res;
}

} // namespace Envoy::Extractor
