#pragma once
#include <utility>

#include "data_access.h"
#include "redis_connection.h"

namespace keyscope {

// data_access over a live RESP connection
class redis_data_access : public data_access
{
public:
    redis_data_access() = default;
    explicit redis_data_access(connection_options opts) : m_opts(std::move(opts)) {}

    core_status connect();
    core_status connect(const connection_options& opts);
    void disconnect();

    core_status scan(uint64_t cursor, std::string_view pattern,
                     size_t count, scan_page& out) override;
    core_status type_of(std::string_view key, key_type& out) override;
    core_status type_of_many(const std::vector<std::string>& keys, type_map& out) override;
    core_status ttl(std::string_view key, int64_t& out) override;

    std::string encoding(std::string_view key) override;
    std::optional<int64_t> memory_usage(std::string_view key) override;
    std::map<int, int64_t> keyspace_info() override;

    core_status remove(std::string_view key, bool& removed) override;
    core_status select_db(int index) override;
    int current_db() const override { return m_conn.current_db(); }

    core_status command(const std::vector<std::string>& args, resp::reply& out) override;
    core_status reconnect() override;
    bool is_connected() const override { return m_conn.is_connected(); }

    const connection_options& options() const { return m_opts; }
    std::string label() const { return m_conn.options().label(); }

private:
    connection_options m_opts;
    redis_connection m_conn;
};

// Parses the body of INFO keyspace ("db0:keys=12,expires=0,avg_ttl=0").
// Malformed lines are skipped.
std::map<int, int64_t> parse_keyspace_info(std::string_view info);

} // namespace keyscope
