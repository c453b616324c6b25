#include "Query.hpp"
#include <sstream>

namespace Chronicle {

Query& Query::where(const std::string &column, Op op, nlohmann::json value){
    conds.push_back(Condition{column, op, std::move(value)});
    return *this;
}

Query& Query::whereIn(const std::string &column, std::vector<nlohmann::json> values){
    nlohmann::json arr = nlohmann::json::array();
    for(auto &v : values) arr.push_back(std::move(v));
    return where(column, Op::In, std::move(arr));
}

static const char* opSQL(Op op){
    switch(op){
        case Op::Eq: return " = ";
        case Op::NotEq: return " <> ";
        case Op::Lt: return " < ";
        case Op::Lte: return " <= ";
        case Op::Gt: return " > ";
        case Op::Gte: return " >= ";
        default: return "";
    }
}

bool Query::compile(std::string &outWhere, std::vector<BoundValue> &params, std::string *outError) const {
    outWhere.clear();
    if(conds.empty()) return true;
    std::ostringstream ss;
    ss << " WHERE ";
    bool first = true;
    for(const auto &c : conds){
        auto column = schemaPtr->findColumn(c.column);
        if(!column){
            if(outError) *outError = "unknown column '" + c.column + "' for " + schemaPtr->itemType;
            return false;
        }
        if(!first) ss << " AND ";
        first = false;
        const std::string col = quoteIdent(schemaPtr->table) + "." + quoteIdent(c.column);
        switch(c.op){
            case Op::IsNull: ss << col << " IS NULL"; break;
            case Op::NotNull: ss << col << " IS NOT NULL"; break;
            case Op::In: {
                if(!c.value.is_array()){
                    if(outError) *outError = "IN condition on '" + c.column + "' needs an array";
                    return false;
                }
                // empty IN matches nothing
                if(c.value.empty()){ ss << "0"; break; }
                ss << col << " IN (";
                for(size_t i = 0; i < c.value.size(); ++i){
                    if(i) ss << ", ";
                    ss << "?";
                    params.push_back(BoundValue{*column, c.value[i]});
                }
                ss << ")";
                break;
            }
            default:
                if(c.value.is_null()){
                    ss << col << (c.op == Op::NotEq ? " IS NOT NULL" : " IS NULL");
                    break;
                }
                ss << col << opSQL(c.op) << "?";
                params.push_back(BoundValue{*column, c.value});
        }
    }
    outWhere = ss.str();
    return true;
}

int bindAll(IStatement &stmt, int firstIdx, const std::vector<BoundValue> &params){
    int idx = firstIdx;
    for(const auto &p : params) bindValue(stmt, idx++, p.column, p.value);
    return idx;
}

} // namespace Chronicle
