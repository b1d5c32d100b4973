#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <pwd.h>
#include <unistd.h>
#include <array>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string sha256_file_hex(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("cannot open " + path.string());

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1){
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }

    std::array<char, 64 * 1024> buf;
    while(in){
        in.read(buf.data(), buf.size());
        auto n = in.gcount();
        if(n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) != 1){
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }
    if(in.bad()) throw std::runtime_error("read error on " + path.string());

    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if(EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1){
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    out.resize(len);
    return hex_from_bytes(out);
}

std::string random_uuid(){
    std::array<unsigned char, 16> id{};
    if(RAND_bytes(id.data(), static_cast<int>(id.size())) != 1){
        // entropy pool unavailable; fall back to the C++ generator
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        for(auto& b : id) b = static_cast<unsigned char>(rng());
    }
    id[6] = (id[6] & 0x0F) | 0x40;
    id[8] = (id[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    for(std::size_t i = 0; i < id.size(); ++i){
        if(i==4||i==6||i==8||i==10) oss << "-";
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
    }
    return oss.str();
}

std::string expand_tilde(const std::string& path){
    if(path.rfind("~/", 0) != 0) return path;
    const char* home = std::getenv("HOME");
    if(!home || !*home){
        if(const passwd* pw = getpwuid(getuid())) home = pw->pw_dir;
    }
    if(!home || !*home) return path;
    return (std::filesystem::path(home) / path.substr(2)).string();
}
