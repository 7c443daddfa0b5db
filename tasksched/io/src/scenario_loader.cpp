#include <tasksched/io/scenario_loader.hpp>
#include <tasksched/io/error.hpp>

#include <tasksched/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace tasksched::io {

namespace {

using namespace tasksched::core;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return std::string(member.GetString(), member.GetStringLength());
}

uint64_t as_uint64(const rapidjson::Value& member, const char* name, const std::string& context) {
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

int64_t as_int64(const rapidjson::Value& member, const char* name, const std::string& context) {
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt64();
}

double as_double(const rapidjson::Value& member, const char* name, const std::string& context) {
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

std::set<TaskId> as_id_set(const rapidjson::Value& member, const char* name, const std::string& context) {
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array of strings", context);
    }
    std::set<TaskId> ids;
    for (const auto& item : member.GetArray()) {
        if (!item.IsString()) {
            throw LoaderError(std::string("field '") + name + "' must be an array of strings", context);
        }
        ids.emplace(item.GetString(), item.GetStringLength());
    }
    return ids;
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

Task parse_task(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("task must be an object", ctx);
    }

    TaskId id = get_string(obj, "id", ctx);
    auto duration = as_uint64(get_member(obj, "duration", ctx), "duration", ctx);
    auto workers = as_uint64(get_member(obj, "workers", ctx), "workers", ctx);

    std::set<TaskId> dependencies;
    if (obj.HasMember("dependencies")) {
        dependencies = as_id_set(obj["dependencies"], "dependencies", ctx);
    }

    double priority = 1.0;
    if (obj.HasMember("priority")) {
        priority = as_double(obj["priority"], "priority", ctx);
    }

    std::optional<TimePoint> deadline;
    if (obj.HasMember("deadline") && !obj["deadline"].IsNull()) {
        deadline = time_from_units(as_int64(obj["deadline"], "deadline", ctx));
    }

    try {
        return Task(std::move(id), Duration{static_cast<int64_t>(duration)}, std::move(dependencies),
                    static_cast<std::size_t>(workers), priority, deadline);
    } catch (const InvalidTaskError& e) {
        throw LoaderError(e.what(), ctx);
    }
}

TaskPatch parse_patch(const rapidjson::Value& obj, const std::string& ctx) {
    TaskPatch patch;
    if (obj.HasMember("duration")) {
        patch.duration = Duration{static_cast<int64_t>(as_uint64(obj["duration"], "duration", ctx))};
    }
    if (obj.HasMember("workers")) {
        patch.workers_required = static_cast<std::size_t>(as_uint64(obj["workers"], "workers", ctx));
    }
    if (obj.HasMember("priority")) {
        patch.priority = as_double(obj["priority"], "priority", ctx);
    }
    if (obj.HasMember("dependencies")) {
        patch.dependencies = as_id_set(obj["dependencies"], "dependencies", ctx);
    }
    if (obj.HasMember("deadline")) {
        if (obj["deadline"].IsNull()) {
            patch.clear_deadline = true;
        } else {
            patch.deadline = time_from_units(as_int64(obj["deadline"], "deadline", ctx));
        }
    }
    return patch;
}

ScheduledCommand parse_command(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("command must be an object", ctx);
    }

    std::size_t after_step = 0;
    if (obj.HasMember("after_step")) {
        after_step = static_cast<std::size_t>(as_uint64(obj["after_step"], "after_step", ctx));
    }

    std::string op = get_string(obj, "op", ctx);
    if (op == "add") {
        return ScheduledCommand{after_step, algo::AddTask{parse_task(get_member(obj, "task", ctx), ctx + ".task")}};
    }
    if (op == "modify") {
        return ScheduledCommand{after_step, algo::ModifyTask{get_string(obj, "id", ctx), parse_patch(obj, ctx)}};
    }
    if (op == "remove") {
        return ScheduledCommand{after_step, algo::RemoveTask{get_string(obj, "id", ctx)}};
    }
    throw LoaderError("unknown op '" + op + "' (expected add, modify or remove)", ctx);
}

void parse_scenario_impl(ScenarioData& result, const rapidjson::Document& doc) {
    result.config.capacity = static_cast<std::size_t>(
        as_uint64(get_member(doc, "capacity", "scenario"), "capacity", "scenario"));

    if (doc.HasMember("value_function")) {
        result.config.value_function = parse_value_function(get_string(doc, "value_function", "scenario"));
    }
    if (doc.HasMember("time_advance")) {
        result.config.time_advance = parse_time_advance(get_string(doc, "time_advance", "scenario"));
    }

    if (doc.HasMember("tasks")) {
        const auto& tasks = get_array(doc, "tasks", "scenario");
        for (rapidjson::SizeType tidx = 0; tidx < tasks.Size(); ++tidx) {
            result.tasks.push_back(parse_task(tasks[tidx], "tasks[" + std::to_string(tidx) + "]"));
        }
    }

    if (doc.HasMember("commands")) {
        const auto& commands = get_array(doc, "commands", "scenario");
        for (rapidjson::SizeType cidx = 0; cidx < commands.Size(); ++cidx) {
            result.commands.push_back(parse_command(commands[cidx], "commands[" + std::to_string(cidx) + "]"));
        }
    }
}

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, std::string_view str) {
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

void write_id_array(JsonWriter& writer, const std::set<TaskId>& ids) {
    writer.StartArray();
    for (const auto& id : ids) {
        write_string(writer, id);
    }
    writer.EndArray();
}

void write_task(JsonWriter& writer, const Task& task) {
    writer.StartObject();
    writer.Key("id");
    write_string(writer, task.id());
    writer.Key("duration");
    writer.Int64(task.duration().count());
    writer.Key("workers");
    writer.Uint64(task.workers_required());
    writer.Key("priority");
    writer.Double(task.priority());
    if (!task.dependencies().empty()) {
        writer.Key("dependencies");
        write_id_array(writer, task.dependencies());
    }
    if (task.deadline()) {
        writer.Key("deadline");
        writer.Int64(time_to_units(*task.deadline()));
    }
    writer.EndObject();
}

void write_command(JsonWriter& writer, const ScheduledCommand& scheduled) {
    writer.StartObject();
    writer.Key("after_step");
    writer.Uint64(scheduled.after_step);
    writer.Key("op");
    write_string(writer, algo::command_name(scheduled.command));

    std::visit([&writer](const auto& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, algo::AddTask>) {
            writer.Key("task");
            write_task(writer, cmd.task);
        } else if constexpr (std::is_same_v<T, algo::ModifyTask>) {
            writer.Key("id");
            write_string(writer, cmd.id);
            const auto& patch = cmd.patch;
            if (patch.duration) {
                writer.Key("duration");
                writer.Int64(patch.duration->count());
            }
            if (patch.workers_required) {
                writer.Key("workers");
                writer.Uint64(*patch.workers_required);
            }
            if (patch.priority) {
                writer.Key("priority");
                writer.Double(*patch.priority);
            }
            if (patch.dependencies) {
                writer.Key("dependencies");
                write_id_array(writer, *patch.dependencies);
            }
            if (patch.clear_deadline) {
                writer.Key("deadline");
                writer.Null();
            } else if (patch.deadline) {
                writer.Key("deadline");
                writer.Int64(time_to_units(*patch.deadline));
            }
        } else if constexpr (std::is_same_v<T, algo::RemoveTask>) {
            writer.Key("id");
            write_string(writer, cmd.id);
        }
    }, scheduled.command);

    writer.EndObject();
}

} // anonymous namespace

algo::ValueFunction parse_value_function(std::string_view name) {
    if (name == "priority") {
        return algo::ValueFunction::Priority;
    }
    if (name == "priority_per_unit") {
        return algo::ValueFunction::PriorityPerUnit;
    }
    throw LoaderError("unknown value function '" + std::string(name) +
                      "' (expected priority or priority_per_unit)", "value_function");
}

algo::TimeAdvance parse_time_advance(std::string_view name) {
    if (name == "unit") {
        return algo::TimeAdvance::Unit;
    }
    if (name == "next_event") {
        return algo::TimeAdvance::NextEvent;
    }
    throw LoaderError("unknown time advance '" + std::string(name) +
                      "' (expected unit or next_event)", "time_advance");
}

ScenarioData load_scenario(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_scenario_from_string(oss.str());
}

ScenarioData load_scenario_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "scenario");
    }

    ScenarioData result;
    parse_scenario_impl(result, doc);
    return result;
}

void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("capacity");
    writer.Uint64(scenario.config.capacity);
    writer.Key("value_function");
    write_string(writer, algo::to_string(scenario.config.value_function));
    writer.Key("time_advance");
    write_string(writer, algo::to_string(scenario.config.time_advance));

    writer.Key("tasks");
    writer.StartArray();
    for (const auto& task : scenario.tasks) {
        write_task(writer, task);
    }
    writer.EndArray();

    if (!scenario.commands.empty()) {
        writer.Key("commands");
        writer.StartArray();
        for (const auto& scheduled : scenario.commands) {
            write_command(writer, scheduled);
        }
        writer.EndArray();
    }

    writer.EndObject();

    out << buffer.GetString();
}

void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_scenario_to_stream(scenario, file);
}

algo::CommandQueue make_command_queue(const ScenarioData& scenario) {
    algo::CommandQueue queue;
    for (const auto& scheduled : scenario.commands) {
        queue.schedule(scheduled.after_step, scheduled.command);
    }
    return queue;
}

} // namespace tasksched::io
