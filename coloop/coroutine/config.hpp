//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  coloop/coroutine/config.hpp
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

#ifndef COLOOP_COROUTINE_CONFIG_HPP
#define COLOOP_COROUTINE_CONFIG_HPP

#include "coloop/config.hpp"


/*
    Detect API usage.
*/
# if !defined COLOOP_COROUTINE_EXPORTS
#   define COLOOP_COROUTINE_DECL
# else
#   if defined COLOOP_COROUTINE_SOURCE
#       define COLOOP_COROUTINE_DECL COLOOP_EXPORT_DECL
#   else
#       define COLOOP_COROUTINE_DECL COLOOP_IMPORT_DECL
#   endif
#   define COLOOP_COROUTINE_CALL COLOOP_CALL
# endif


/*
    Defaults for the Scheduler.
*/
# if !defined COLOOP_COROUTINE_MAX_EVENTS
#   define COLOOP_COROUTINE_MAX_EVENTS 64
# endif


#endif  // COLOOP_COROUTINE_CONFIG_HPP

//  $CUSTOM_FOOTER$
