#ifndef NETDUT_EXPORT_H
#define NETDUT_EXPORT_H

#if defined(_WIN32) && !defined(NETDUT_STATIC)
#ifdef netdut_core_EXPORTS
#define NETDUT_API __declspec(dllexport)
#else
#define NETDUT_API __declspec(dllimport)
#endif
#else
#define NETDUT_API
#endif

#endif // NETDUT_EXPORT_H
