#include "Changeset.hpp"
#include <algorithm>

namespace Chronicle {

Changeset::Changeset(const EntitySchema &schema, Record data)
    : schemaPtr(&schema), baseData(data.is_object() ? std::move(data) : Record::object()) {}

Changeset Changeset::cast(const EntitySchema &schema, Record data, const Record &params,
                          const std::vector<std::string> &permitted){
    Changeset cs(schema, std::move(data));
    if(!params.is_object()) return cs;
    for(auto it = params.begin(); it != params.end(); ++it){
        const std::string &field = it.key();
        if(std::find(permitted.begin(), permitted.end(), field) == permitted.end()) continue;
        auto column = schema.findColumn(field);
        if(!column) continue;
        if(!valueFitsColumn(*column, it.value()) && !it.value().is_null()){
            cs.addError(field, "is invalid");
            continue;
        }
        nlohmann::json current = cs.baseData.contains(field) ? cs.baseData[field] : nlohmann::json();
        if(current == it.value()) continue;
        cs.changeMap[field] = it.value();
    }
    return cs;
}

Changeset Changeset::forEntity(const EntitySchema &schema, Record data){
    return Changeset(schema, std::move(data));
}

Changeset& Changeset::validateRequired(const std::vector<std::string> &fields){
    for(const auto &f : fields){
        nlohmann::json v = fetchField(f);
        bool blank = v.is_null() || (v.is_string() && v.get<std::string>().empty());
        // only report once per field
        if(blank && fieldErrors.find(f) == fieldErrors.end()) addError(f, "can't be blank");
    }
    return *this;
}

Changeset& Changeset::putChange(const std::string &field, nlohmann::json value){
    changeMap[field] = std::move(value);
    return *this;
}

Changeset& Changeset::addError(const std::string &field, const std::string &message){
    fieldErrors[field].push_back(message);
    return *this;
}

Changeset& Changeset::dropChanges(const std::vector<std::string> &fields){
    for(const auto &f : fields) changeMap.erase(f);
    return *this;
}

nlohmann::json Changeset::fetchField(const std::string &field) const {
    auto c = changeMap.find(field);
    if(c != changeMap.end()) return *c;
    auto d = baseData.find(field);
    if(d != baseData.end()) return *d;
    return nullptr;
}

Record Changeset::applyChanges() const {
    Record out = baseData;
    for(auto it = changeMap.begin(); it != changeMap.end(); ++it) out[it.key()] = it.value();
    return out;
}

bool Changeset::operator==(const Changeset &other) const {
    return schemaPtr == other.schemaPtr && baseData == other.baseData
        && changeMap == other.changeMap && fieldErrors == other.fieldErrors;
}

} // namespace Chronicle
