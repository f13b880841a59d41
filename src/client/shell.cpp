// ======================= shell.cpp =======================
// 交互式命令行：一个 virtual_host、一条 connection，手动驱动 broker
//   mqsim_shell [heartbeat_sec] [channel_max] [confirm_timeout_ms]
#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../common/exchange.hpp"
#include "../common/queue.hpp"
#include "../server/connection.hpp"

using namespace mqsim;

namespace {

std::map<uint16_t, channel::ptr> g_channels;

channel::ptr select_channel(std::istringstream& iss)
{
    int cid = 0;
    iss >> cid;
    auto it = g_channels.find(static_cast<uint16_t>(cid));
    if (it == g_channels.end()) {
        std::cout << "No such channel: " << cid << std::endl;
        return nullptr;
    }
    return it->second;
}

confirm_channel::ptr as_confirm(const channel::ptr& ch)
{
    auto cc = std::dynamic_pointer_cast<confirm_channel>(ch);
    if (!cc) std::cout << "Channel " << ch->id() << " is not a confirm channel." << std::endl;
    return cc;
}

void print_message(const char* prefix, const message_ptr& msg)
{
    if (!msg) {
        std::cout << prefix << " (none)" << std::endl;
        return;
    }
    std::cout << prefix << " tag=" << msg->fields().delivery_tag()
              << " exchange=\"" << msg->fields().exchange() << "\""
              << " routing_key=" << msg->fields().routing_key()
              << (msg->fields().redelivered() ? " redelivered" : "")
              << " body=\"" << msg->body() << "\"" << std::endl;
}

void print_usage()
{
    std::cout << "Commands:\n"
              << "open                                   (prints channel id)\n"
              << "open_confirm                           (channel with publisher confirms)\n"
              << "close <cid>\n"
              << "exchange_declare <cid> <name> <direct|fanout|topic|headers>\n"
              << "exchange_delete <cid> <name>\n"
              << "exchange_bind <cid> <dest> <source> <pattern>\n"
              << "queue_declare <cid> <name|-> [k=v&k2=v2]\n"
              << "queue_status <cid> <queue>\n"
              << "queue_purge <cid> <queue>\n"
              << "queue_delete <cid> <queue>\n"
              << "bind <cid> <exch> <queue> <pattern> [k=v&k2=v2]\n"
              << "unbind <cid> <exch> <queue> <pattern>\n"
              << "publish <cid> <exch> <routing_key> <message>\n"
              << "get <cid> <queue>\n"
              << "consume <cid> <queue> [consumer_tag]\n"
              << "cancel <cid> <consumer_tag>\n"
              << "ack <cid> <tag>\n"
              << "nack <cid> <tag> [requeue 0|1]\n"
              << "prefetch <cid> <count> [global 0|1]\n"
              << "recover <cid>\n"
              << "wait <cid>                             (wait for confirms)\n"
              << "exit\n";
}

} // namespace

int main(int argc, char* argv[])
{
    /* ① 解析参数 */
    connection_options opts;
    opts.name = "mqsim-shell";
    if (argc >= 2) opts.heartbeat_sec = std::atof(argv[1]);
    if (argc >= 3) opts.channel_max = static_cast<uint16_t>(std::atoi(argv[2]));
    if (argc >= 4) opts.confirm_timeout = std::chrono::milliseconds(std::atol(argv[3]));

    /* ② 建立 broker 与连接 */
    auto host = std::make_shared<virtual_host>();
    connection conn(host, opts);
    conn.on_event([](connection_event ev, const std::string& detail) {
        if (ev == connection_event::heartbeat) return;
        std::cout << "[Connection] " << connection_event_name(ev) << " " << detail << std::endl;
    });
    conn.connect();

    print_usage();

    std::string command;
    while (true) {
        std::cout << "mqsim> ";
        if (!std::getline(std::cin, command)) break;
        if (command.empty()) continue;
        std::istringstream iss(command);
        std::string cmd;
        iss >> cmd;
        if (cmd == "exit") break;

        try {
            if (cmd == "open" || cmd == "open_confirm") {
                channel::ptr ch = (cmd == "open") ? conn.create_channel()
                                                  : conn.create_confirm_channel();
                ch->on_return([](const message_ptr& msg) { print_message("[Returned]", msg); });
                g_channels[ch->id()] = ch;
                std::cout << "[Channel] opened " << ch->id() << std::endl;
            } else if (cmd == "close") {
                if (auto ch = select_channel(iss)) {
                    ch->close();
                    g_channels.erase(ch->id());
                }
            } else if (cmd == "exchange_declare") {
                std::string ename, etype;
                if (auto ch = select_channel(iss)) {
                    iss >> ename >> etype;
                    ch->assert_exchange(ename, exchange_type_from_string(etype));
                    std::cout << "[OK]" << std::endl;
                }
            } else if (cmd == "exchange_delete") {
                std::string ename;
                if (auto ch = select_channel(iss)) {
                    iss >> ename;
                    ch->delete_exchange(ename);
                    std::cout << "[OK]" << std::endl;
                }
            } else if (cmd == "exchange_bind") {
                std::string dest, source, pattern;
                if (auto ch = select_channel(iss)) {
                    iss >> dest >> source >> pattern;
                    ch->bind_exchange(dest, source, pattern);
                    std::cout << "[OK]" << std::endl;
                }
            } else if (cmd == "queue_declare") {
                std::string qname, args;
                if (auto ch = select_channel(iss)) {
                    iss >> qname >> args;
                    if (qname == "-") qname.clear();   // 由 broker 生成队列名
                    auto ok = ch->assert_queue(qname, false, false, false, parse_field_table(args));
                    std::cout << "[Queue] " << ok.queue << " messages=" << ok.message_count
                              << " consumers=" << ok.consumer_count << std::endl;
                }
            } else if (cmd == "queue_status") {
                std::string qname;
                if (auto ch = select_channel(iss)) {
                    iss >> qname;
                    auto ok = ch->check_queue(qname);
                    std::cout << "[Queue] " << ok.queue << " messages=" << ok.message_count
                              << " consumers=" << ok.consumer_count << std::endl;
                }
            } else if (cmd == "queue_purge") {
                std::string qname;
                if (auto ch = select_channel(iss)) {
                    iss >> qname;
                    std::cout << "[Purged] " << ch->purge_queue(qname) << std::endl;
                }
            } else if (cmd == "queue_delete") {
                std::string qname;
                if (auto ch = select_channel(iss)) {
                    iss >> qname;
                    std::cout << "[Deleted] purged " << ch->delete_queue(qname) << std::endl;
                }
            } else if (cmd == "bind" || cmd == "unbind") {
                std::string exch, qname, key, args;
                if (auto ch = select_channel(iss)) {
                    iss >> exch >> qname >> key >> args;
                    if (cmd == "bind") ch->bind_queue(qname, exch, key, parse_field_table(args));
                    else               ch->unbind_queue(qname, exch, key);
                    std::cout << "[OK]" << std::endl;
                }
            } else if (cmd == "publish") {
                std::string exch, rkey, msg;
                if (auto ch = select_channel(iss)) {
                    iss >> exch >> rkey;
                    std::getline(iss, msg);
                    if (!msg.empty() && msg[0] == ' ') msg.erase(0, 1);
                    if (exch == "-") exch.clear();   // 默认交换机
                    if (auto cc = std::dynamic_pointer_cast<confirm_channel>(ch)) {
                        cc->publish(exch, rkey, msg, [](uint64_t seq, bool acked) {
                            std::cout << "[Confirm] seq=" << seq << (acked ? " ack" : " nack")
                                      << std::endl;
                        }, BasicProperties(), true);
                    } else {
                        ch->publish(exch, rkey, msg, BasicProperties(), true);
                    }
                }
            } else if (cmd == "get") {
                std::string qname;
                if (auto ch = select_channel(iss)) {
                    iss >> qname;
                    print_message("[Pulled Message]", ch->get(qname));
                }
            } else if (cmd == "consume") {
                std::string qname, tag;
                if (auto ch = select_channel(iss)) {
                    iss >> qname >> tag;
                    consume_options copts;
                    copts.consumer_tag = tag;
                    std::string ctag = ch->consume(qname, [](const message_ptr& msg) {
                        if (!msg) {
                            std::cout << "[Consumer] cancelled by broker" << std::endl;
                            return;
                        }
                        print_message("[Message Received]", msg);
                    }, copts);
                    std::cout << "[Consumer] " << ctag << std::endl;
                }
            } else if (cmd == "cancel") {
                std::string tag;
                if (auto ch = select_channel(iss)) {
                    iss >> tag;
                    ch->cancel(tag);
                    std::cout << "[OK]" << std::endl;
                }
            } else if (cmd == "ack") {
                uint64_t tag = 0;
                if (auto ch = select_channel(iss)) {
                    iss >> tag;
                    ch->ack(tag);
                }
            } else if (cmd == "nack") {
                uint64_t tag = 0;
                int requeue = 1;
                if (auto ch = select_channel(iss)) {
                    iss >> tag >> requeue;
                    ch->nack(tag, false, requeue != 0);
                }
            } else if (cmd == "prefetch") {
                uint32_t count = 0;
                int global = 0;
                if (auto ch = select_channel(iss)) {
                    iss >> count >> global;
                    ch->prefetch(count, global != 0);
                }
            } else if (cmd == "recover") {
                if (auto ch = select_channel(iss)) {
                    std::cout << "[Recovered] " << ch->recover() << std::endl;
                }
            } else if (cmd == "wait") {
                if (auto ch = select_channel(iss)) {
                    if (auto cc = as_confirm(ch)) {
                        std::cout << "[Confirms] " << (cc->wait_for_confirms() ? "all acked" : "some nacked")
                                  << std::endl;
                    }
                }
            } else {
                std::cout << "Unknown command." << std::endl;
            }
        } catch (const mq_error& e) {
            std::cout << "[Error] " << e.what() << std::endl;
        }
    }

    /* ③ 清理 */
    g_channels.clear();
    conn.close();
    return 0;
}
