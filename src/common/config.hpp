#ifndef PARETO_COMMON_CONFIG_HPP
#define PARETO_COMMON_CONFIG_HPP
/*
 * JSON configuration for an exploration sweep.
 * ---------------------------------------------------------------------------
 *  {
 *    "damping": 0.1, "momentum": 0.9,
 *    "warmup_ratio": 1.0, "sample_ratio": 0.25,
 *    "num_steps": 10, "max_iter": 50,
 *    "weights": [[0.5, 0.5], [0.2, 0.8]],     or  "lattice_divisions": 4
 *    "directions": [0, 1],
 *    "optimizer": { "learning_rate": 0.01, "momentum": 0.0, ... },
 *    "evaluation": { "batch_size": 256, "print_summary": false },
 *    "checkpoint_root": "runs/mnist",
 *    "save_checkpoints": true, "overwrite_checkpoints": false,
 *    "strict_convergence": false, "print_summary": true
 *  }
 * Missing keys keep their defaults, unknown keys are ignored, and the result
 * is validated against the number of tasks before it is returned.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "errors.hpp"
#include "save_load.hpp"
#include "../data/simplex.hpp"
#include "../exploration/options.hpp"

namespace Pareto::Common::Config {
    using PropertyTree = boost::property_tree::ptree;

    inline constexpr const char* kOptionsFile = "exploration.json";

    namespace Detail {
        template <class Value>
        void read_optional(const PropertyTree& tree, const std::string& key, Value& target)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                return;
            }
            try {
                target = child->get_value<Value>();
            } catch (const boost::property_tree::ptree_bad_data& error) {
                throw ConfigurationError("Configuration key '" + key + "' has an invalid value: " + error.what());
            }
        }

        inline std::vector<double> read_vector(const PropertyTree& array, const std::string& context)
        {
            std::vector<double> values;
            values.reserve(array.size());
            for (const auto& element : array) {
                if (!element.first.empty()) {
                    throw ConfigurationError("Configuration key '" + context + "' must be an array.");
                }
                const auto value = element.second.get_value_optional<double>();
                if (!value) {
                    throw ConfigurationError("Configuration key '" + context + "' holds a non-numeric entry.");
                }
                values.push_back(*value);
            }
            return values;
        }

        template <class Value>
        PropertyTree write_vector(const std::vector<Value>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }
    }

    [[nodiscard]] inline Exploration::ExplorationOptions parse_exploration_options(const PropertyTree& tree,
                                                                                   std::size_t num_tasks,
                                                                                   Exploration::ExplorationOptions options = {})
    {
        Detail::read_optional(tree, "damping", options.damping);
        Detail::read_optional(tree, "momentum", options.momentum);
        Detail::read_optional(tree, "warmup_ratio", options.warmup_ratio);
        Detail::read_optional(tree, "sample_ratio", options.sample_ratio);
        Detail::read_optional(tree, "num_steps", options.num_steps);
        Detail::read_optional(tree, "max_iter", options.max_iter);

        const auto weights = tree.get_child_optional("weights");
        const bool has_divisions = static_cast<bool>(tree.get_child_optional("lattice_divisions"));
        if (weights && has_divisions) {
            throw ConfigurationError("Configuration may give either 'weights' or 'lattice_divisions', not both.");
        }
        if (weights) {
            options.weights.clear();
            for (const auto& row : *weights) {
                options.weights.push_back(Detail::read_vector(row.second, "weights"));
            }
        } else if (has_divisions) {
            std::size_t divisions{0};
            Detail::read_optional(tree, "lattice_divisions", divisions);
            options.weights = Data::Simplex::lattice(num_tasks, divisions);
        }

        if (const auto directions = tree.get_child_optional("directions")) {
            options.directions.clear();
            for (const auto& entry : *directions) {
                const auto value = entry.second.get_value_optional<std::size_t>();
                if (!value) {
                    throw ConfigurationError("Configuration key 'directions' must list task indices.");
                }
                options.directions.push_back(*value);
            }
        }

        auto& sgd = options.optimizer.options;
        Detail::read_optional(tree, "optimizer.learning_rate", sgd.learning_rate);
        Detail::read_optional(tree, "optimizer.momentum", sgd.momentum);
        Detail::read_optional(tree, "optimizer.dampening", sgd.dampening);
        Detail::read_optional(tree, "optimizer.weight_decay", sgd.weight_decay);
        Detail::read_optional(tree, "optimizer.nesterov", sgd.nesterov);

        Detail::read_optional(tree, "evaluation.batch_size", options.evaluation.batch_size);
        Detail::read_optional(tree, "evaluation.print_summary", options.evaluation.print_summary);

        if (const auto root = tree.get_optional<std::string>("checkpoint_root")) {
            options.checkpoint_root = *root;
        }
        Detail::read_optional(tree, "save_checkpoints", options.save_checkpoints);
        Detail::read_optional(tree, "overwrite_checkpoints", options.overwrite_checkpoints);
        Detail::read_optional(tree, "strict_convergence", options.strict_convergence);
        Detail::read_optional(tree, "print_summary", options.print_summary);

        Exploration::validate(options, num_tasks);
        return options;
    }

    [[nodiscard]] inline Exploration::ExplorationOptions load_exploration_options(const std::filesystem::path& path,
                                                                                  std::size_t num_tasks,
                                                                                  Exploration::ExplorationOptions defaults = {})
    {
        if (!std::filesystem::exists(path)) {
            throw ConfigurationError("Configuration file not found at '" + path.string() + "'.");
        }
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw ConfigurationError("Malformed configuration file '" + path.string() + "': " + error.what());
        }
        return parse_exploration_options(tree, num_tasks, std::move(defaults));
    }

    [[nodiscard]] inline PropertyTree serialize_exploration_options(const Exploration::ExplorationOptions& options)
    {
        PropertyTree tree;
        tree.put("damping", options.damping);
        tree.put("momentum", options.momentum);
        tree.put("warmup_ratio", options.warmup_ratio);
        tree.put("sample_ratio", options.sample_ratio);
        tree.put("num_steps", options.num_steps);
        tree.put("max_iter", options.max_iter);

        PropertyTree weights;
        for (const auto& row : options.weights) {
            weights.push_back({"", Detail::write_vector(row)});
        }
        tree.add_child("weights", weights);
        tree.add_child("directions", Detail::write_vector(options.directions));

        const auto& sgd = options.optimizer.options;
        tree.put("optimizer.learning_rate", sgd.learning_rate);
        tree.put("optimizer.momentum", sgd.momentum);
        tree.put("optimizer.dampening", sgd.dampening);
        tree.put("optimizer.weight_decay", sgd.weight_decay);
        tree.put("optimizer.nesterov", sgd.nesterov);

        tree.put("evaluation.batch_size", options.evaluation.batch_size);
        tree.put("evaluation.print_summary", options.evaluation.print_summary);

        tree.put("checkpoint_root", options.checkpoint_root.string());
        tree.put("save_checkpoints", options.save_checkpoints);
        tree.put("overwrite_checkpoints", options.overwrite_checkpoints);
        tree.put("strict_convergence", options.strict_convergence);
        tree.put("print_summary", options.print_summary);
        return tree;
    }

    inline void save_exploration_options(const std::filesystem::path& path, const Exploration::ExplorationOptions& options)
    {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        SaveLoad::write_json_file(path, serialize_exploration_options(options));
    }
}

#endif // PARETO_COMMON_CONFIG_HPP
