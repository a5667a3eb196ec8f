#ifndef PRAM_PROBE_HPP
#define PRAM_PROBE_HPP

#include <pram/group_query.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pram {

class GroupPopulation;

/**
 * Read-only observer run once per iteration after mass transfer.
 * A run without an iteration captures the state before the first iteration.
 */
class Probe {
public:
    explicit Probe(std::string name) : name_(std::move(name)) {}
    virtual ~Probe() = default;

    const std::string& name() const { return name_; }

    virtual void run(const GroupPopulation& pop, std::optional<std::size_t> iter, std::optional<double> t) = 0;

private:
    std::string name_;
};

/**
 * Records the mass (or mass proportion) of groups matching each of a list
 * of named queries, one row per run.
 */
class GroupMassProbe : public Probe {
public:
    struct Row {
        std::optional<std::size_t> iter;
        std::optional<double> t;
        std::vector<double> values;
    };

    GroupMassProbe(std::string name, std::vector<std::pair<std::string, GroupQuery>> queries,
                   bool as_proportion = false);

    void run(const GroupPopulation& pop, std::optional<std::size_t> iter, std::optional<double> t) override;

    const std::vector<std::string>& labels() const { return labels_; }
    const std::vector<Row>& rows() const { return rows_; }
    void clear() { rows_.clear(); }

    // Header plus one line per recorded row
    std::string to_string() const;

private:
    std::vector<std::string> labels_;
    std::vector<GroupQuery> queries_;
    bool as_proportion_;
    std::vector<Row> rows_;
};

} // namespace pram

#endif // PRAM_PROBE_HPP
