#include <pram/probe.hpp>
#include <pram/group_population.hpp>
#include <iomanip>
#include <sstream>

namespace pram {

GroupMassProbe::GroupMassProbe(std::string name, std::vector<std::pair<std::string, GroupQuery>> queries,
                               bool as_proportion)
    : Probe(std::move(name))
    , as_proportion_(as_proportion) {
    for (auto& [label, qry] : queries) {
        labels_.push_back(label);
        queries_.push_back(std::move(qry));
    }
}

void GroupMassProbe::run(const GroupPopulation& pop, std::optional<std::size_t> iter, std::optional<double> t) {
    Row row{iter, t, {}};
    row.values.reserve(queries_.size());
    for (const auto& qry : queries_) {
        row.values.push_back(as_proportion_ ? pop.get_groups_mass_prop(&qry) : pop.get_groups_mass(&qry));
    }
    rows_.push_back(std::move(row));
}

std::string GroupMassProbe::to_string() const {
    std::ostringstream oss;
    oss << std::setw(6) << "iter";
    for (const auto& label : labels_) {
        oss << "  " << std::setw(12) << label;
    }
    oss << "\n";

    for (const auto& row : rows_) {
        if (row.iter.has_value()) {
            oss << std::setw(6) << *row.iter;
        } else {
            oss << std::setw(6) << "init";
        }
        for (double v : row.values) {
            oss << "  " << std::setw(12) << std::fixed << std::setprecision(as_proportion_ ? 4 : 1) << v;
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace pram
