
#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <string>

using namespace std;


class ABException : public std::exception {
    string message;
    string data;

public:
    ABException(string msg) : message(msg) {}
    ABException(string msg, string d) : message(msg), data(d) {}

    string detail() const { return message; }
    string getData() const { return data; }
    const char *what() const noexcept { return message.c_str(); }
};


#endif

