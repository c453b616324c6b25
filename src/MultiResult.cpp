#include "MultiResult.hpp"
#include <sstream>

namespace Chronicle {

std::string StepKey::toString() const {
    if(!itemId) return name;
    return name + ":" + std::to_string(*itemId);
}

std::string describeStepError(const StepError &error){
    if(auto cs = std::get_if<Changeset>(&error)){
        std::ostringstream ss;
        ss << "invalid " << cs->schema().itemType << ":";
        for(const auto &f : cs->errors()){
            for(const auto &m : f.second) ss << " " << f.first << " " << m << ";";
        }
        return ss.str();
    }
    if(auto pe = std::get_if<PersistenceError>(&error)) return pe->message;
    return std::get<nlohmann::json>(error).dump();
}

std::vector<StepKey> MultiResult::keys() const {
    std::vector<StepKey> out;
    out.reserve(values.size());
    for(const auto &p : values) out.push_back(p.first);
    return out;
}

const StepValue& MultiResult::at(const StepKey &key) const {
    auto it = values.find(key);
    if(it == values.end()) throw std::out_of_range("no step result for '" + key.toString() + "'");
    return it->second;
}

CommitResult CommitResult::success(MultiResult changes, std::optional<StepValue> selected){
    CommitResult r;
    r.succeeded = true;
    r.results = std::move(changes);
    r.selectedValue = std::move(selected);
    return r;
}

CommitResult CommitResult::failure(StepKey failedStep, StepError error, MultiResult partial){
    CommitResult r;
    r.succeeded = false;
    r.results = std::move(partial);
    r.failed = std::move(failedStep);
    r.err = std::move(error);
    return r;
}

const StepKey& CommitResult::failedStep() const {
    if(!failed) throw std::logic_error("CommitResult::failedStep on a successful commit");
    return *failed;
}

const StepError& CommitResult::error() const {
    if(!err) throw std::logic_error("CommitResult::error on a successful commit");
    return *err;
}

const Changeset* CommitResult::changesetError() const {
    return err ? std::get_if<Changeset>(&*err) : nullptr;
}

const PersistenceError* CommitResult::persistenceError() const {
    return err ? std::get_if<PersistenceError>(&*err) : nullptr;
}

} // namespace Chronicle
