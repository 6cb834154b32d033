// POSIX environment shim for tests that flip ALKEY_* variables.

#include "test_env.hpp"
#include <cstdlib>

static void set_or_unset(const std::string& name, const char* value){
    if(!value || !*value) ::unsetenv(name.c_str());
    else ::setenv(name.c_str(), value, 1);
}

ScopedEnv::ScopedEnv(const char* name, const char* value) : name_(name){
    if(const char* old = std::getenv(name)) previous_ = old;
    set_or_unset(name_, value);
}

ScopedEnv::~ScopedEnv(){
    set_or_unset(name_, previous_ ? previous_->c_str() : nullptr);
}
