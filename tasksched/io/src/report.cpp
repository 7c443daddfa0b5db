#include <tasksched/io/report.hpp>
#include <tasksched/io/error.hpp>

#include <tasksched/algo/deadline_tracker.hpp>
#include <tasksched/algo/diagnostics.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <fstream>
#include <string_view>
#include <vector>

namespace tasksched::io {

namespace {

using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, std::string_view str) {
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

void write_ids(JsonWriter& writer, const std::vector<core::TaskId>& ids) {
    writer.StartArray();
    for (const auto& id : ids) {
        write_string(writer, id);
    }
    writer.EndArray();
}

void write_schedule(JsonWriter& writer, const core::ScheduleLog& log) {
    writer.StartArray();
    for (const auto& record : log) {
        writer.StartObject();
        writer.Key("time");
        writer.Int64(core::time_to_units(record.time));
        writer.Key("started");
        write_ids(writer, record.started);
        writer.Key("completed");
        write_ids(writer, record.completed);
        writer.EndObject();
    }
    writer.EndArray();
}

void write_completions(JsonWriter& writer, const algo::SchedulerEngine& engine) {
    writer.StartObject();
    for (const auto& entry : algo::DeadlineTracker::evaluate(engine)) {
        writer.Key(entry.task_id.c_str(), static_cast<rapidjson::SizeType>(entry.task_id.size()));
        writer.StartObject();
        writer.Key("finish");
        writer.Int64(core::time_to_units(entry.finish));
        if (entry.deadline) {
            writer.Key("deadline");
            writer.Int64(core::time_to_units(*entry.deadline));
        }
        writer.Key("deadline_status");
        write_string(writer, algo::to_string(entry.status));
        writer.EndObject();
    }
    writer.EndObject();
}

void write_diagnostics(JsonWriter& writer, const algo::SchedulerEngine& engine) {
    writer.StartObject();

    writer.Key("blocked_on_missing_dependencies");
    writer.StartObject();
    for (const auto& [id, missing] : algo::blocked_on_missing_dependencies(engine.registry(), engine.completed())) {
        writer.Key(id.c_str(), static_cast<rapidjson::SizeType>(id.size()));
        write_ids(writer, missing);
    }
    writer.EndObject();

    writer.Key("oversized_tasks");
    write_ids(writer, algo::oversized_tasks(engine.registry(), engine.capacity()));

    writer.Key("dependency_cycles");
    writer.StartArray();
    for (const auto& cycle : algo::dependency_cycles(engine.registry(), engine.completed())) {
        write_ids(writer, cycle);
    }
    writer.EndArray();

    writer.EndObject();
}

} // anonymous namespace

void write_report(const algo::SchedulerEngine& engine, std::ostream& out,
                  const algo::RunSummary* summary) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();

    writer.Key("capacity");
    writer.Uint64(engine.capacity());
    writer.Key("value_function");
    write_string(writer, algo::to_string(engine.config().value_function));
    writer.Key("time_advance");
    write_string(writer, algo::to_string(engine.config().time_advance));

    writer.Key("time");
    writer.Int64(core::time_to_units(engine.time()));
    writer.Key("steps");
    writer.Uint64(engine.steps());
    writer.Key("terminal");
    writer.Bool(engine.is_terminal());

    if (summary != nullptr) {
        writer.Key("status");
        write_string(writer, algo::to_string(summary->status));
        writer.Key("mutations_applied");
        writer.Uint64(summary->mutations_applied);
        writer.Key("mutations_rejected");
        writer.Uint64(summary->mutations_rejected);
    }

    writer.Key("schedule");
    write_schedule(writer, engine.log());

    writer.Key("completions");
    write_completions(writer, engine);

    writer.Key("in_progress");
    writer.StartArray();
    for (const auto& [id, commitment] : engine.in_progress()) {
        writer.StartObject();
        writer.Key("id");
        write_string(writer, id);
        writer.Key("start");
        writer.Int64(core::time_to_units(commitment.start));
        writer.Key("finish");
        writer.Int64(core::time_to_units(commitment.finish));
        writer.Key("workers");
        writer.Uint64(commitment.workers);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("diagnostics");
    write_diagnostics(writer, engine);

    writer.EndObject();

    out << buffer.GetString() << '\n';
}

void write_report(const algo::SchedulerEngine& engine, const std::filesystem::path& path,
                  const algo::RunSummary* summary) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_report(engine, file, summary);
}

} // namespace tasksched::io
