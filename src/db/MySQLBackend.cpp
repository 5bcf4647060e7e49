#include "db/MySQLBackend.hpp"
#include <plog/Log.h>
#include <mysqlx/xdevapi.h>

namespace CapBridge {

struct MySQLImpl {
    std::unique_ptr<mysqlx::Session> sess;
};

static bool looksLikeAuthFailure(const std::string &msg){
    return msg.find("Access denied") != std::string::npos || msg.find("Authentication failed") != std::string::npos;
}

MySQLBackend::MySQLBackend(){ impl = std::make_unique<MySQLImpl>(); }
MySQLBackend::~MySQLBackend(){ close(); }

bool MySQLBackend::open(const DBConnectionInfo &info, std::string *outError){
    authRejected = false;
    try{
        impl->sess = std::make_unique<mysqlx::Session>(
            mysqlx::SessionOption::HOST, info.mysql_host,
            mysqlx::SessionOption::PORT, info.mysql_port,
            mysqlx::SessionOption::USER, info.mysql_user,
            mysqlx::SessionOption::PWD, info.mysql_password,
            mysqlx::SessionOption::SSL_MODE, info.mysql_use_ssl ? mysqlx::SSLMode::REQUIRED : mysqlx::SSLMode::DISABLED,
            mysqlx::SessionOption::CONNECT_TIMEOUT, static_cast<unsigned>(info.connect_timeout_seconds * 1000)
        );
        // quick health check
        mysqlx::SqlResult r = impl->sess->sql("SELECT 1").execute();
        auto row = r.fetchOne();
        if(!row.isNull()) {
            PLOGI << "MySQLBackend: connected to " << info.mysql_host << ":" << info.mysql_port;
            if(outError) outError->clear();
            return true;
        }
        if(outError) *outError = "MySQL: health query returned no rows";
        return false;
    } catch(const mysqlx::Error &e){
        std::string msg = e.what();
        authRejected = looksLikeAuthFailure(msg);
        if(msg.find("unexpected message") != std::string::npos || msg.find("Unexpected message") != std::string::npos){
            msg += " -- the server is probably not speaking the X Protocol on this port (3306 instead of 33060?)";
        }
        if(outError) *outError = msg;
        return false;
    } catch(const std::exception &ex){
        std::string msg = ex.what();
        authRejected = looksLikeAuthFailure(msg);
        if(outError) *outError = msg;
        return false;
    }
}

void MySQLBackend::close(){
    if(impl && impl->sess){
        try { impl->sess->close(); }
        catch(const mysqlx::Error &e){ PLOGW << "MySQLBackend: close failed: " << e.what(); }
        impl->sess.reset();
    }
}

} // namespace CapBridge
