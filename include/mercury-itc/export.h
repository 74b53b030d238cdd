#ifndef MERCURY_ITC_EXPORT_H
#define MERCURY_ITC_EXPORT_H

#ifdef _WIN32
#ifdef mercury_itc_core_EXPORTS
#define MERCURY_ITC_API __declspec(dllexport)
#else
#define MERCURY_ITC_API __declspec(dllimport)
#endif
#else
#define MERCURY_ITC_API
#endif

#endif // MERCURY_ITC_EXPORT_H
