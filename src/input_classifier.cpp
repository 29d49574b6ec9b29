#include "modelsmith/input_classifier.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <iterator>
#include <map>
#include <optional>
#include <ranges>
#include <set>
#include <string_view>

namespace
{
using modelsmith::bundle_file;
using modelsmith::error;
using modelsmith::error_code;
using modelsmith::input_file;
using modelsmith::model_bundle;
using modelsmith::model_format;

enum class file_kind
{
    inert,
    unknown,
    onnx,
    tflite,
    pytorch,
    frozen_graph,
    savedmodel_marker,
    caffe_graph,
    caffe_weights,
    darknet_config,
    darknet_weights,
    checkpoint_meta,
    checkpoint_index,
    checkpoint_data,
    checkpoint_alias
};

enum class file_family
{
    single,
    caffe,
    darknet,
    checkpoint
};

struct parsed_file
{
    const input_file* source{nullptr};
    std::string basename;
    std::string stem;
    file_kind kind{file_kind::unknown};
    std::size_t shard_index{0};
    std::size_t shard_total{0};
};

constexpr std::string_view k_savedmodel_marker = "saved_model.pb";

constexpr std::array<std::pair<std::string_view, file_kind>, 13> k_extensions{{
    {".onnx", file_kind::onnx},
    {".tflite", file_kind::tflite},
    {".pt", file_kind::pytorch},
    {".pth", file_kind::pytorch},
    {".pytorch", file_kind::pytorch},
    {".pb", file_kind::frozen_graph},
    {".prototxt", file_kind::caffe_graph},
    {".caffemodel", file_kind::caffe_weights},
    {".cfg", file_kind::darknet_config},
    {".weights", file_kind::darknet_weights},
    {".meta", file_kind::checkpoint_meta},
    {".index", file_kind::checkpoint_index},
    {".ckpt", file_kind::checkpoint_alias},
}};

constexpr std::array<std::string_view, 6> k_inert_extensions{".txt", ".md", ".rst", ".names", ".labels", ".license"};
constexpr std::array<std::string_view, 3> k_inert_names{"readme", "license", "checkpoint"};

std::string to_lower(std::string_view value)
{
    std::string result{value};
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string basename_of(const std::string& name)
{
    const auto pos = name.find_last_of("/\\");
    return pos == std::string::npos ? name : name.substr(pos + 1);
}

std::optional<std::size_t> parse_digits(std::string_view digits)
{
    if (digits.empty())
    {
        return std::nullopt;
    }
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
    {
        return std::nullopt;
    }
    return value;
}

// Recognises "<stem>.data-00000-of-00002".
bool parse_data_shard(const std::string& basename, parsed_file& out)
{
    const auto lower = to_lower(basename);
    const auto marker = lower.rfind(".data-");
    if (marker == std::string::npos)
    {
        return false;
    }

    const std::string_view suffix = std::string_view{lower}.substr(marker + 6);
    const auto of_pos = suffix.find("-of-");
    if (of_pos == std::string_view::npos)
    {
        return false;
    }

    const auto index = parse_digits(suffix.substr(0, of_pos));
    const auto total = parse_digits(suffix.substr(of_pos + 4));
    if (!index || !total || *total == 0)
    {
        return false;
    }

    out.kind = file_kind::checkpoint_data;
    out.stem = basename.substr(0, marker);
    out.shard_index = *index;
    out.shard_total = *total;
    return true;
}

parsed_file parse(const input_file& file)
{
    parsed_file parsed;
    parsed.source = &file;
    parsed.basename = basename_of(file.name);

    const auto lower = to_lower(parsed.basename);
    if (lower.empty())
    {
        return parsed;
    }

    if (lower.front() == '.')
    {
        parsed.kind = file_kind::inert;
        return parsed;
    }

    if (lower == k_savedmodel_marker)
    {
        parsed.kind = file_kind::savedmodel_marker;
        parsed.stem = "saved_model";
        return parsed;
    }

    if (parse_data_shard(parsed.basename, parsed))
    {
        return parsed;
    }

    const auto dot = lower.rfind('.');
    if (dot == std::string::npos)
    {
        if (std::ranges::find(k_inert_names, std::string_view{lower}) != k_inert_names.end())
        {
            parsed.kind = file_kind::inert;
        }
        return parsed;
    }

    const std::string_view extension = std::string_view{lower}.substr(dot);
    parsed.stem = parsed.basename.substr(0, dot);

    if (std::ranges::find(k_inert_extensions, extension) != k_inert_extensions.end())
    {
        parsed.kind = file_kind::inert;
        return parsed;
    }

    const auto it = std::ranges::find_if(k_extensions, [extension](const auto& entry) { return entry.first == extension; });
    if (it != k_extensions.end())
    {
        parsed.kind = it->second;
    }
    return parsed;
}

file_family family_of(file_kind kind)
{
    switch (kind)
    {
    case file_kind::caffe_graph:
    case file_kind::caffe_weights:
        return file_family::caffe;
    case file_kind::darknet_config:
    case file_kind::darknet_weights:
        return file_family::darknet;
    case file_kind::checkpoint_meta:
    case file_kind::checkpoint_index:
    case file_kind::checkpoint_data:
    case file_kind::checkpoint_alias:
        return file_family::checkpoint;
    default:
        return file_family::single;
    }
}

std::string_view family_label(file_family family)
{
    switch (family)
    {
    case file_family::single:
        return "single-file";
    case file_family::caffe:
        return "Caffe";
    case file_family::darknet:
        return "Darknet";
    case file_family::checkpoint:
        return "TensorFlow checkpoint";
    }
    return "unknown";
}

bundle_file to_bundle_file(const parsed_file& file)
{
    return bundle_file{file.source->name, file.source->ref};
}

std::unexpected<error> fail(error_code code, std::string message)
{
    return std::unexpected(error{code, std::move(message)});
}

model_bundle make_bundle(model_format format)
{
    model_bundle bundle;
    bundle.format = format;
    bundle.primary_role = std::string{modelsmith::format_info(format).primary_role};
    return bundle;
}

std::expected<model_bundle, error> classify_single(const std::vector<parsed_file>& files)
{
    if (files.size() > 1)
    {
        return fail(error_code::ambiguous_input,
                    "Expected one model file but found " + std::to_string(files.size()) + ": " + files[0].basename +
                        ", " + files[1].basename);
    }

    const auto& file = files.front();
    model_format format = model_format::onnx;
    switch (file.kind)
    {
    case file_kind::onnx:
        format = model_format::onnx;
        break;
    case file_kind::tflite:
        format = model_format::tflite;
        break;
    case file_kind::pytorch:
        format = model_format::pytorch;
        break;
    case file_kind::frozen_graph:
        format = model_format::tensorflow_frozen;
        break;
    default:
        return fail(error_code::unsupported_format, "Not a single-file model: " + file.basename);
    }

    auto bundle = make_bundle(format);
    bundle.roles.emplace(bundle.primary_role, to_bundle_file(file));
    return bundle;
}

struct pair_rule
{
    model_format format;
    file_kind first_kind;
    std::string_view first_role;
    std::string_view first_extension;
    file_kind second_kind;
    std::string_view second_role;
    std::string_view second_extension;
};

constexpr pair_rule k_caffe_rule{model_format::caffe,
                                 file_kind::caffe_graph,
                                 "graph",
                                 ".prototxt",
                                 file_kind::caffe_weights,
                                 "weights",
                                 ".caffemodel"};
constexpr pair_rule k_darknet_rule{model_format::darknet,
                                   file_kind::darknet_config,
                                   "config",
                                   ".cfg",
                                   file_kind::darknet_weights,
                                   "weights",
                                   ".weights"};

std::expected<model_bundle, error> classify_pair(const std::vector<parsed_file>& files, const pair_rule& rule)
{
    struct stem_pair
    {
        const parsed_file* first{nullptr};
        const parsed_file* second{nullptr};
    };

    std::map<std::string, stem_pair> by_stem;
    std::vector<const parsed_file*> firsts;
    std::vector<const parsed_file*> seconds;
    for (const auto& file : files)
    {
        auto& slot = by_stem[file.stem];
        auto& target = file.kind == rule.first_kind ? slot.first : slot.second;
        if (target)
        {
            return fail(error_code::ambiguous_input, "Duplicate file for model '" + file.stem + "': " + file.basename);
        }
        target = &file;
        (file.kind == rule.first_kind ? firsts : seconds).push_back(&file);
    }

    std::vector<std::string> complete;
    for (const auto& [stem, pair] : by_stem)
    {
        if (pair.first && pair.second)
        {
            complete.push_back(stem);
        }
    }

    const auto label = modelsmith::format_info(rule.format).label;
    const stem_pair* chosen = nullptr;
    stem_pair fallback;

    if (complete.size() > 1)
    {
        return fail(error_code::ambiguous_input,
                    "Multiple complete " + std::string{label} + " models: " + complete[0] + ", " + complete[1]);
    }

    if (complete.size() == 1)
    {
        if (by_stem.size() > 1)
        {
            return fail(error_code::ambiguous_input,
                        "Unpaired " + std::string{label} + " files next to model '" + complete.front() + "'");
        }
        chosen = &by_stem.at(complete.front());
    }
    else if (firsts.size() == 1 && seconds.size() == 1)
    {
        // Names differ but the upload holds exactly one file per role.
        fallback = stem_pair{firsts.front(), seconds.front()};
        chosen = &fallback;
    }
    else
    {
        const auto& [stem, pair] = *by_stem.begin();
        const auto missing_role = pair.first ? rule.second_role : rule.first_role;
        const auto missing_extension = pair.first ? rule.second_extension : rule.first_extension;
        return fail(error_code::missing_role,
                    std::string{label} + " model '" + stem + "' is missing role " + std::string{missing_role} + " (" +
                        std::string{missing_extension} + ")");
    }

    auto bundle = make_bundle(rule.format);
    bundle.roles.emplace(std::string{rule.first_role}, to_bundle_file(*chosen->first));
    bundle.roles.emplace(std::string{rule.second_role}, to_bundle_file(*chosen->second));
    return bundle;
}

struct shard_set
{
    std::map<std::size_t, const parsed_file*> shards;
    std::size_t total{0};
};

// Adds a data shard, rejecting duplicates and inconsistent shard totals.
std::expected<void, error> add_shard(shard_set& set, const parsed_file& file)
{
    if (set.total != 0 && set.total != file.shard_total)
    {
        return fail(error_code::ambiguous_input, "Inconsistent shard count for '" + file.stem + "': " + file.basename);
    }
    set.total = file.shard_total;
    if (file.shard_index >= file.shard_total)
    {
        return fail(error_code::ambiguous_input, "Shard index out of range: " + file.basename);
    }
    if (!set.shards.emplace(file.shard_index, &file).second)
    {
        return fail(error_code::ambiguous_input, "Duplicate shard: " + file.basename);
    }
    return {};
}

std::optional<std::size_t> first_missing_shard(const shard_set& set)
{
    const auto total = std::max<std::size_t>(set.total, 1);
    for (std::size_t i = 0; i < total; ++i)
    {
        if (!set.shards.contains(i))
        {
            return i;
        }
    }
    return std::nullopt;
}

std::expected<model_bundle, error> classify_checkpoint(const std::vector<parsed_file>& files)
{
    struct checkpoint_group
    {
        const parsed_file* meta{nullptr};
        const parsed_file* index{nullptr};
        const parsed_file* alias{nullptr};
        shard_set data;

        [[nodiscard]] bool complete() const
        {
            return meta && index && !first_missing_shard(data).has_value();
        }
    };

    std::map<std::string, checkpoint_group> groups;
    std::vector<const parsed_file*> aliases;
    for (const auto& file : files)
    {
        if (file.kind == file_kind::checkpoint_alias)
        {
            aliases.push_back(&file);
            continue;
        }

        auto& group = groups[file.stem];
        if (file.kind == file_kind::checkpoint_data)
        {
            if (auto added = add_shard(group.data, file); !added)
            {
                return std::unexpected(added.error());
            }
            continue;
        }

        auto& slot = file.kind == file_kind::checkpoint_meta ? group.meta : group.index;
        if (slot)
        {
            return fail(error_code::ambiguous_input, "Duplicate checkpoint file: " + file.basename);
        }
        slot = &file;
    }

    // "model.ckpt" aliases the group "model.ckpt" (TensorFlow's own naming) or "model".
    for (const auto* alias : aliases)
    {
        auto it = groups.find(alias->basename);
        if (it == groups.end())
        {
            it = groups.find(alias->stem);
        }
        if (it == groups.end())
        {
            it = groups.emplace(alias->basename, checkpoint_group{}).first;
        }
        if (it->second.alias)
        {
            return fail(error_code::ambiguous_input, "Duplicate checkpoint alias: " + alias->basename);
        }
        it->second.alias = alias;
    }

    std::vector<std::string> complete;
    for (const auto& [stem, group] : groups)
    {
        if (group.complete())
        {
            complete.push_back(stem);
        }
    }

    if (complete.size() > 1)
    {
        return fail(error_code::ambiguous_input,
                    "Multiple complete TensorFlow checkpoints: " + complete[0] + ", " + complete[1]);
    }
    if (complete.size() == 1 && groups.size() > 1)
    {
        return fail(error_code::ambiguous_input,
                    "Unrelated checkpoint files next to checkpoint '" + complete.front() + "'");
    }
    if (complete.empty())
    {
        const auto& [stem, group] = *groups.begin();
        std::string missing;
        if (!group.meta)
        {
            missing = "graph (.meta)";
        }
        else if (!group.index)
        {
            missing = "index (.index)";
        }
        else
        {
            missing = modelsmith::shard_role("data", first_missing_shard(group.data).value_or(0)) + " (.data-*)";
        }
        return fail(error_code::missing_role, "TensorFlow checkpoint '" + stem + "' is missing role " + missing);
    }

    const auto& group = groups.at(complete.front());
    auto bundle = make_bundle(model_format::tensorflow_checkpoint);
    bundle.roles.emplace("graph", to_bundle_file(*group.meta));
    bundle.roles.emplace("index", to_bundle_file(*group.index));
    for (const auto& [index, shard] : group.data.shards)
    {
        bundle.roles.emplace(modelsmith::shard_role("data", index), to_bundle_file(*shard));
    }
    if (group.alias)
    {
        bundle.roles.emplace("alias", to_bundle_file(*group.alias));
    }
    return bundle;
}

std::expected<model_bundle, error> classify_savedmodel(const std::vector<parsed_file>& files)
{
    const parsed_file* graph = nullptr;
    const parsed_file* index = nullptr;
    shard_set data;

    for (const auto& file : files)
    {
        switch (file.kind)
        {
        case file_kind::savedmodel_marker:
            if (graph)
            {
                return fail(error_code::ambiguous_input, "Multiple SavedModel graphs in input");
            }
            graph = &file;
            break;
        case file_kind::checkpoint_index:
            if (index)
            {
                return fail(error_code::ambiguous_input,
                            "Multiple variables indexes: " + index->basename + ", " + file.basename);
            }
            index = &file;
            break;
        case file_kind::checkpoint_data:
            if (auto added = add_shard(data, file); !added)
            {
                return std::unexpected(added.error());
            }
            break;
        default:
            return fail(error_code::ambiguous_input, "Unexpected file next to a SavedModel: " + file.basename);
        }
    }

    if (!index)
    {
        return fail(error_code::missing_role, "TensorFlow SavedModel is missing role variables_index (.index)");
    }
    if (const auto missing = first_missing_shard(data))
    {
        return fail(error_code::missing_role,
                    "TensorFlow SavedModel is missing role " + modelsmith::shard_role("variables_data", *missing) +
                        " (.data-*)");
    }
    for (const auto* shard : data.shards | std::views::values)
    {
        if (shard->stem != index->stem)
        {
            return fail(error_code::ambiguous_input,
                        "Variables shard does not belong to " + index->basename + ": " + shard->basename);
        }
    }

    auto bundle = make_bundle(model_format::tensorflow_savedmodel);
    bundle.roles.emplace("graph", to_bundle_file(*graph));
    bundle.roles.emplace("variables_index", to_bundle_file(*index));
    for (const auto& [shard_index, shard] : data.shards)
    {
        bundle.roles.emplace(modelsmith::shard_role("variables_data", shard_index), to_bundle_file(*shard));
    }
    return bundle;
}
} // namespace

namespace modelsmith
{

bool is_inert_file(const std::string& name)
{
    const input_file file{name, {}};
    return parse(file).kind == file_kind::inert;
}

std::expected<model_bundle, error> classify(const std::vector<input_file>& files)
{
    if (files.empty())
    {
        return fail(error_code::unsupported_format, "No input files");
    }

    std::vector<parsed_file> model_files;
    model_files.reserve(files.size());
    for (const auto& file : files)
    {
        auto parsed = parse(file);
        if (parsed.kind == file_kind::unknown)
        {
            return fail(error_code::unsupported_format, "Unsupported file type: " + parsed.basename);
        }
        if (parsed.kind != file_kind::inert)
        {
            model_files.push_back(std::move(parsed));
        }
    }

    if (model_files.empty())
    {
        return fail(error_code::unsupported_format, "No recognized model file in input");
    }

    if (std::ranges::any_of(model_files,
                            [](const parsed_file& file) { return file.kind == file_kind::savedmodel_marker; }))
    {
        return classify_savedmodel(model_files);
    }

    std::set<file_family> families;
    for (const auto& file : model_files)
    {
        families.insert(family_of(file.kind));
    }
    if (families.size() > 1)
    {
        return fail(error_code::ambiguous_input,
                    "Input mixes " + std::string{family_label(*families.begin())} + " and " +
                        std::string{family_label(*std::next(families.begin()))} + " model files");
    }

    switch (*families.begin())
    {
    case file_family::single:
        return classify_single(model_files);
    case file_family::caffe:
        return classify_pair(model_files, k_caffe_rule);
    case file_family::darknet:
        return classify_pair(model_files, k_darknet_rule);
    case file_family::checkpoint:
        return classify_checkpoint(model_files);
    }
    return fail(error_code::unsupported_format, "No recognized model file in input");
}

} // namespace modelsmith
