#ifndef SPLITFILE_SYSCALL_CHECKER_H
#define SPLITFILE_SYSCALL_CHECKER_H

//----------------------------------------------------------------------------------------------------------------------

#include <cerrno>
#include <system_error>
#include <sstream>
#include <string>

//----------------------------------------------------------------------------------------------------------------------

namespace splitfile
{
namespace errors
{
    class syscall_result_failed : public std::exception
    {
    private:
        std::string  _condition;
        int          _line;
        int          _errorCode;
        std::string  _msg;

    public:
        inline syscall_result_failed(std::string condition, int line, int errorCode) :
                _condition(condition), _line(line), _errorCode(errorCode)
        {
            std::ostringstream msg;
            msg <<  "check_error failed on line " << line << ": " << condition << "\t [ errno = " << errorCode << ": ";
            msg << std::system_error(errorCode, std::system_category()).what() << " ]";

            _msg = msg.str();
        }

        inline virtual const char* what() const throw () {
            return _msg.c_str();
        }

        inline int errorCode() const  { return _errorCode; }
        inline int line() const  { return _line; }
        inline const std::string& condition() const  { return _condition; }
    };

    // errno is read before anything else can clobber it
    inline void throwLastError(const char *condition, int line)
    {
        int errorCode = errno;
        throw syscall_result_failed(condition, line, errorCode);
    }

#define syscall_check(result)  if ((result) < 0)  splitfile::errors::throwLastError(#result, __LINE__)
#define syscall_fail(condition, code)  throw splitfile::errors::syscall_result_failed(condition, __LINE__, code)

}
}

//----------------------------------------------------------------------------------------------------------------------

#endif    //SPLITFILE_SYSCALL_CHECKER_H
