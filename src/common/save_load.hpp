#ifndef PARETO_COMMON_SAVE_LOAD_HPP
#define PARETO_COMMON_SAVE_LOAD_HPP
/*
 * Checkpoint layout
 * ---------------------------------------------------------------------------
 *  <root>/<weight>/start/parameters.binary          SGD-trained starting point
 *  <root>/<weight>/<direction>_<step>/parameters.binary
 *  <root>/<weight>/<direction>_<step>/optimizer.binary
 *  <root>/<weight>/<direction>_<step>/metrics.json
 * Tensors go through libtorch archives under keys "param.<index>" in the order
 * of the model's trainable parameters. Step checkpoints are written once and
 * never rewritten unless overwriting is requested explicitly.
 */
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <torch/torch.h>

#include "errors.hpp"
#include "model.hpp"

namespace Pareto::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    inline constexpr const char* kParametersFile = "parameters.binary";
    inline constexpr const char* kOptimizerFile = "optimizer.binary";
    inline constexpr const char* kMetricsFile = "metrics.json";

    struct CheckpointKey {
        std::size_t weight{0};
        std::size_t direction{0};
        std::size_t step{0};
    };

    struct CheckpointRecord {
        CheckpointKey key{};
        std::vector<double> weights{};
        std::vector<double> losses{};
        std::vector<double> top1{};
        std::vector<double> alpha{};
        double raw_direction_norm{0.0};
        bool solver_converged{false};
        int64_t solver_iterations{0};
        double solver_residual{std::numeric_limits<double>::quiet_NaN()};
    };

    namespace Detail {
        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<bool>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing boolean field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        // Non-finite values are stored as "nan"/"inf" strings and parsed back with strtod.
        inline std::string format_real(double value)
        {
            if (std::isnan(value)) return "nan";
            if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
            std::ostringstream stream;
            stream.precision(17);
            stream << value;
            return stream.str();
        }

        inline double parse_real(const std::string& text, const std::string& context)
        {
            char* end = nullptr;
            const double value = std::strtod(text.c_str(), &end);
            if (text.empty() || end == text.c_str() || *end != '\0') {
                throw std::runtime_error("Invalid real value '" + text + "' in " + context);
            }
            return value;
        }

        inline PropertyTree write_real_array(const std::vector<double>& values)
        {
            PropertyTree array;
            for (const auto value : values) {
                PropertyTree element;
                element.put("", format_real(value));
                array.push_back({"", element});
            }
            return array;
        }

        inline std::vector<double> read_real_array(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                throw std::runtime_error("Missing array field '" + key + "' in " + context);
            }
            std::vector<double> values;
            values.reserve(child->size());
            for (const auto& element : *child) {
                values.push_back(parse_real(element.second.get_value<std::string>(), context + " " + key));
            }
            return values;
        }
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to read '" + path.string() + "': " + error.what());
        }
        return tree;
    }

    [[nodiscard]] inline std::filesystem::path start_directory(const std::filesystem::path& root, std::size_t weight)
    {
        return root / std::to_string(weight) / "start";
    }

    [[nodiscard]] inline std::filesystem::path step_directory(const std::filesystem::path& root, const CheckpointKey& key)
    {
        return root / std::to_string(key.weight) / (std::to_string(key.direction) + "_" + std::to_string(key.step));
    }

    inline void save_parameters(const std::filesystem::path& file, const std::vector<torch::Tensor>& params)
    {
        torch::serialize::OutputArchive archive;
        for (std::size_t i = 0; i < params.size(); ++i) {
            archive.write("param." + std::to_string(i), params[i].detach().to(torch::kCPU));
        }
        try {
            archive.save_to(file.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to write parameter archive '" + file.string() + "': " + error.what());
        }
    }

    // Copies archived values into the live parameters; shapes must match exactly.
    inline void load_parameters(const std::filesystem::path& file, const std::vector<torch::Tensor>& params)
    {
        if (!std::filesystem::exists(file)) {
            throw std::runtime_error("Parameter archive not found at '" + file.string() + "'.");
        }
        torch::serialize::InputArchive archive;
        try {
            archive.load_from(file.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to open parameter archive '" + file.string() + "': " + error.what());
        }

        std::vector<torch::Tensor> stored(params.size());
        for (std::size_t i = 0; i < params.size(); ++i) {
            const auto key = "param." + std::to_string(i);
            try {
                archive.read(key, stored[i]);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Checkpoint is missing parameter '" + key + "': " + error.what());
            }
            if (!stored[i].defined()) {
                throw std::runtime_error("Checkpoint parameter '" + key + "' is undefined.");
            }
            if (stored[i].sizes() != params[i].sizes()) {
                throw ConfigurationError("Parameter '" + key + "' shape mismatch: expected "
                                         + format_tensor_shape(params[i]) + " but found "
                                         + format_tensor_shape(stored[i]) + ".");
            }
        }

        torch::NoGradGuard no_grad;
        for (std::size_t i = 0; i < params.size(); ++i) {
            params[i].copy_(stored[i]);
        }
    }

    inline void save_optimizer(const std::filesystem::path& file, const torch::optim::Optimizer& optimizer)
    {
        torch::serialize::OutputArchive archive;
        optimizer.save(archive);
        try {
            archive.save_to(file.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to write optimizer archive '" + file.string() + "': " + error.what());
        }
    }

    inline void load_optimizer(const std::filesystem::path& file, torch::optim::Optimizer& optimizer)
    {
        torch::serialize::InputArchive archive;
        try {
            archive.load_from(file.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to open optimizer archive '" + file.string() + "': " + error.what());
        }
        optimizer.load(archive);
    }

    // Stores the SGD-trained starting point of one weight combination.
    inline std::filesystem::path write_start(const std::filesystem::path& root,
                                             std::size_t weight,
                                             const std::vector<torch::Tensor>& params)
    {
        const auto directory = start_directory(root, weight);
        std::filesystem::create_directories(directory);
        const auto file = directory / kParametersFile;
        save_parameters(file, params);
        return file;
    }

    inline void load_start(const std::filesystem::path& root, std::size_t weight, const std::vector<torch::Tensor>& params)
    {
        load_parameters(start_directory(root, weight) / kParametersFile, params);
    }

    [[nodiscard]] inline PropertyTree serialize_record(const CheckpointRecord& record)
    {
        PropertyTree tree;
        tree.put("weight", static_cast<std::uint64_t>(record.key.weight));
        tree.put("direction", static_cast<std::uint64_t>(record.key.direction));
        tree.put("step", static_cast<std::uint64_t>(record.key.step));
        tree.add_child("weights", Detail::write_real_array(record.weights));
        tree.add_child("metrics.losses", Detail::write_real_array(record.losses));
        tree.add_child("metrics.top1", Detail::write_real_array(record.top1));
        tree.add_child("alpha", Detail::write_real_array(record.alpha));
        tree.put("raw_direction_norm", Detail::format_real(record.raw_direction_norm));
        tree.put("solver.converged", record.solver_converged);
        tree.put("solver.iterations", record.solver_iterations);
        tree.put("solver.residual", Detail::format_real(record.solver_residual));
        return tree;
    }

    [[nodiscard]] inline CheckpointRecord deserialize_record(const PropertyTree& tree, const std::string& context)
    {
        CheckpointRecord record{};
        record.key.weight = Detail::get_numeric<std::uint64_t>(tree, "weight", context);
        record.key.direction = Detail::get_numeric<std::uint64_t>(tree, "direction", context);
        record.key.step = Detail::get_numeric<std::uint64_t>(tree, "step", context);
        record.weights = Detail::read_real_array(tree, "weights", context);
        record.losses = Detail::read_real_array(tree, "metrics.losses", context);
        record.top1 = Detail::read_real_array(tree, "metrics.top1", context);
        record.alpha = Detail::read_real_array(tree, "alpha", context);
        record.raw_direction_norm = Detail::parse_real(tree.get<std::string>("raw_direction_norm", ""), context);
        record.solver_converged = Detail::get_boolean(tree, "solver.converged", context);
        record.solver_iterations = Detail::get_numeric<int64_t>(tree, "solver.iterations", context);
        record.solver_residual = Detail::parse_real(tree.get<std::string>("solver.residual", ""), context);
        return record;
    }

    inline std::filesystem::path write_checkpoint(const std::filesystem::path& root,
                                                  const CheckpointRecord& record,
                                                  const std::vector<torch::Tensor>& params,
                                                  const torch::optim::Optimizer& optimizer,
                                                  bool overwrite = false)
    {
        namespace fs = std::filesystem;
        const auto directory = step_directory(root, record.key);
        if (fs::exists(directory / kMetricsFile) && !overwrite) {
            throw std::runtime_error("Checkpoint '" + directory.string()
                                     + "' already exists; enable overwriting to replace it.");
        }
        fs::create_directories(directory);

        save_parameters(directory / kParametersFile, params);
        save_optimizer(directory / kOptimizerFile, optimizer);
        // Metrics last: their presence marks a complete checkpoint.
        write_json_file(directory / kMetricsFile, serialize_record(record));
        return directory;
    }

    [[nodiscard]] inline CheckpointRecord read_metrics(const std::filesystem::path& directory)
    {
        const auto path = directory / kMetricsFile;
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Metrics file not found at '" + path.string() + "'.");
        }
        return deserialize_record(read_json_file(path), path.string());
    }
}
#endif // PARETO_COMMON_SAVE_LOAD_HPP
