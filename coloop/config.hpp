//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  coloop/config.hpp
//

//
//  IAPPA CM Revision # : $Revision$
//  IAPPA CM Tag        : $Name:  $
//  Last user to change : $Author$
//  Date of change      : $Date$
//  File Path           : $Source$
//  Source of funding   : IAPPA
//
//  CAUTION:  CONTROLLED SOURCE.  DO NOT MODIFY ANYTHING ABOVE THIS LINE.
//

#ifndef COLOOP_CONFIG_HPP
#define COLOOP_CONFIG_HPP


/*
    Detect platform.  The event loop is built on epoll and eventfd.
*/
# if defined __linux__
#   define COLOOP_LINUX
# else
#   error "Coloop requires Linux (epoll, eventfd)."
# endif


/*
    Symbol visibility.
*/
# if defined __GNUC__
#   define COLOOP_EXPORT_DECL __attribute__((visibility("default")))
#   define COLOOP_IMPORT_DECL
# else
#   define COLOOP_EXPORT_DECL
#   define COLOOP_IMPORT_DECL
# endif
# define COLOOP_CALL


#endif  // COLOOP_CONFIG_HPP

//  $CUSTOM_FOOTER$
