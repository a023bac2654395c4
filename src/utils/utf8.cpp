#include "utf8.hpp"

static inline bool is_continuation(char c){
    return (static_cast<unsigned char>(c) & 0xc0) == 0x80;
}

size_t utf8_length(const std::string& str){
    size_t len = 0;
    for( char c : str ){
        if( !is_continuation(c) ){
            len++;
        }
    }
    return len;
}

size_t utf8_offset(const std::string& str, size_t n){
    size_t pos = 0;
    while( pos < str.size() ){
        if( !is_continuation(str[pos]) ){
            if( n == 0 ){
                return pos;
            }
            n--;
        }
        pos++;
    }
    return str.size();
}
